#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace seasonfit {

/* throws std::runtime_error if the file cannot be opened or parsed */
nlohmann::json load_json(const std::string& path);
void           save_json(const std::string& path, const nlohmann::json& j);

/* replaces ${VAR} in every string value by the environment variable */
void expand_env(nlohmann::json& j);

nlohmann::json to_json_array(const Vector& v);
Vector         vector_from_json(const nlohmann::json& j);

} // namespace seasonfit
