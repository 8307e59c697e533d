#include "seasonfit/ReportUtils.hpp"
#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/JsonUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace seasonfit {

CurveSamples sample_curves(const FitResult&         res,
                           const ObservationSeries& series,
                           int                      n_points)
{
    const DoubleSigmoidModel& model = ModelRegistry::instance().get(res.model);

    CurveSamples c;
    if (n_points > 1 && series.size() > 0)
        c.x = Vector::LinSpaced(n_points, series.x.minCoeff(), series.x.maxCoeff());
    else
        c.x = series.x;

    ModelEvaluation ev = model.evaluate(c.x, res.params);
    c.comp1      = std::move(ev.comp1);
    c.comp2      = std::move(ev.comp2);
    c.model      = std::move(ev.value);
    c.raw_x      = series.x;
    c.raw_y      = series.y;
    c.iterations = res.iterations;
    c.chi2       = res.chi2;
    return c;
}

void write_curve_table(const std::string& path, const CurveSamples& c)
{
    std::ofstream out(path);
    if (!out)
        throw std::runtime_error("Cannot write '" + path + "'");

    out << "# iterations " << c.iterations << "  chi2 "
        << std::setprecision(8) << c.chi2 << '\n';
    out << "# x comp1 comp2 model\n";
    out << std::setprecision(10);
    for (Eigen::Index i = 0; i < c.x.size(); ++i)
        out << c.x[i] << ' ' << c.comp1[i] << ' '
            << c.comp2[i] << ' ' << c.model[i] << '\n';
}

void print_summary(std::ostream& os, const std::string& name, const FitResult& r)
{
    os << "[fit]  " << name << "  " << model_name(r.model)
       << "  " << to_string(r.status)
       << "  it=" << r.iterations
       << "  χ²=" << std::setprecision(6) << r.chi2
       << "  σ=" << std::setprecision(4) << r.std_error
       << "  p=[";
    for (Eigen::Index j = 0; j < r.params.size(); ++j)
        os << (j ? ", " : "") << std::setprecision(5) << r.params[j];
    os << "]\n";
}

void write_results(const OutputConfig&      out,
                   const std::string&       stem,
                   const FitResult&         res,
                   const ObservationSeries& series)
{
    if (!out.result_json && !out.curve_samples) return;

    fs::create_directories(out.directory);

    if (out.result_json) {
        nlohmann::json j = res;
        save_json((out.directory / (stem + "_fit.json")).string(), j);
    }
    if (out.curve_samples) {
        write_curve_table((out.directory / (stem + "_curves.dat")).string(),
                          sample_curves(res, series, 200));
    }
}

} // namespace seasonfit
