#pragma once
#include "Types.hpp"
#include "Optimizer.hpp"
#include "ModelRegistry.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace seasonfit {

/* where results go; handed around explicitly, never looked up globally */
struct OutputConfig {
    std::filesystem::path directory      = ".";
    bool                  curve_samples  = true;   // write <stem>_curves.dat
    bool                  result_json    = true;   // write <stem>_fit.json
};

/*
 *  {
 *    "model":   "logistic",
 *    "data":    ["${DATA}/site_a.dat", "site_b.dat"],
 *    "prior":   [0.3, 2.0, 120, 0.08, -2.0, 280, 0.08],        (optional)
 *    "fixed":   [false, false, false, false, false, false, false],
 *    "options": { "maxIterations": 20, "tolerance": 1e-3,
 *                 "precision": "double", "derivatives": "analytic" },
 *    "output":  { "directory": "out", "curveSamples": true }
 *  }
 */
struct FitConfig {
    ModelKind                model = ModelKind::Logistic;
    std::vector<std::string> data;
    std::optional<Vector>    prior;
    FitOptions               options;
    OutputConfig             output;
};

/* environment variables in strings are expanded before parsing */
FitConfig parse_fit_config(nlohmann::json j);

/* ------------------------- JSON converters ----------------------------- */
void to_json  (nlohmann::json& j, const ModelKind& k);
void from_json(const nlohmann::json& j, ModelKind& k);
void to_json  (nlohmann::json& j, const FitStatus& s);
void from_json(const nlohmann::json& j, FitStatus& s);
void to_json  (nlohmann::json& j, const Precision& p);
void from_json(const nlohmann::json& j, Precision& p);
void to_json  (nlohmann::json& j, const DerivativeMode& m);
void from_json(const nlohmann::json& j, DerivativeMode& m);

void to_json  (nlohmann::json& j, const FitOptions& o);
void from_json(const nlohmann::json& j, FitOptions& o);
void to_json  (nlohmann::json& j, const OutputConfig& o);
void from_json(const nlohmann::json& j, OutputConfig& o);

void to_json  (nlohmann::json& j, const FitResult& r);

} // namespace seasonfit
