#include "seasonfit/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <stdexcept>

namespace seasonfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open '" + path + "'");

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Error parsing JSON from " + path + ": " + e.what());
    }
    return j;
}

void save_json(const std::string& path, const nlohmann::json& j)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f << j.dump(2) << '\n';
}

/* substituted text is not scanned again, so values holding ${...} stay literal */
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out;
    auto begin = input.cbegin();
    std::smatch m;
    while (std::regex_search(begin, input.cend(), m, re)) {
        out.append(begin, m[0].first);
        const char* env = std::getenv(m[1].str().c_str());
        if (env) out += env;
        begin = m[0].second;
    }
    out.append(begin, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

nlohmann::json to_json_array(const Vector& v)
{
    return std::vector<double>(v.data(), v.data() + v.size());
}

Vector vector_from_json(const nlohmann::json& j)
{
    const auto values = j.get<std::vector<double>>();
    Vector v(static_cast<Eigen::Index>(values.size()));
    for (std::size_t i = 0; i < values.size(); ++i)
        v[static_cast<Eigen::Index>(i)] = values[i];
    return v;
}

} // namespace seasonfit
