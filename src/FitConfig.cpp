#include "seasonfit/FitConfig.hpp"
#include "seasonfit/JsonUtils.hpp"
#include "seasonfit/Errors.hpp"

namespace seasonfit {

void to_json(nlohmann::json& j, const ModelKind& k)      { j = model_name(k); }
void from_json(const nlohmann::json& j, ModelKind& k)    { k = model_kind_from_string(j.get<std::string>()); }
void to_json(nlohmann::json& j, const FitStatus& s)      { j = to_string(s); }
void from_json(const nlohmann::json& j, FitStatus& s)    { s = fit_status_from_string(j.get<std::string>()); }
void to_json(nlohmann::json& j, const Precision& p)      { j = to_string(p); }
void from_json(const nlohmann::json& j, Precision& p)    { p = precision_from_string(j.get<std::string>()); }
void to_json(nlohmann::json& j, const DerivativeMode& m) { j = to_string(m); }
void from_json(const nlohmann::json& j, DerivativeMode& m)
{
    m = derivative_mode_from_string(j.get<std::string>());
}

void to_json(nlohmann::json& j, const FitOptions& o)
{
    j = nlohmann::json{
        {"maxIterations",   o.max_iterations},
        {"tolerance",       o.tolerance},
        {"precision",       o.precision},
        {"derivatives",     o.derivatives},
        {"initialLambda",   o.initial_lambda},
        {"maxDampingSteps", o.max_damping_steps},
        {"verbose",         o.verbose}
    };
    if (!o.fixed.empty()) j["fixed"] = o.fixed;
}

/* every key is optional, missing ones keep their defaults */
void from_json(const nlohmann::json& j, FitOptions& o)
{
    o.max_iterations    = j.value("maxIterations",   o.max_iterations);
    o.tolerance         = j.value("tolerance",       o.tolerance);
    o.initial_lambda    = j.value("initialLambda",   o.initial_lambda);
    o.max_damping_steps = j.value("maxDampingSteps", o.max_damping_steps);
    o.verbose           = j.value("verbose",         o.verbose);
    if (j.contains("precision"))   o.precision   = j.at("precision").get<Precision>();
    if (j.contains("derivatives")) o.derivatives = j.at("derivatives").get<DerivativeMode>();
    if (j.contains("fixed"))       o.fixed       = j.at("fixed").get<std::vector<bool>>();
}

void to_json(nlohmann::json& j, const OutputConfig& o)
{
    j = nlohmann::json{
        {"directory",    o.directory.string()},
        {"curveSamples", o.curve_samples},
        {"resultJson",   o.result_json}
    };
}

void from_json(const nlohmann::json& j, OutputConfig& o)
{
    if (j.contains("directory"))
        o.directory = j.at("directory").get<std::string>();
    o.curve_samples = j.value("curveSamples", o.curve_samples);
    o.result_json   = j.value("resultJson",   o.result_json);
}

void to_json(nlohmann::json& j, const FitResult& r)
{
    j = nlohmann::json{
        {"model",              r.model},
        {"status",             r.status},
        {"iterations",         r.iterations},
        {"initialChi2",        r.initial_chi2},
        {"chi2",               r.chi2},
        {"standardError",      r.std_error},
        {"nEffective",         r.n_effective},
        {"prior",              to_json_array(r.prior)},
        {"params",             to_json_array(r.params)},
        {"paramUncertainties", to_json_array(r.param_uncertainties)},
        {"chi2History",        r.chi2_history}
    };
}

FitConfig parse_fit_config(nlohmann::json j)
{
    expand_env(j);

    FitConfig cfg;
    cfg.model = j.at("model").get<ModelKind>();

    if (j.at("data").is_string())
        cfg.data.push_back(j.at("data").get<std::string>());
    else
        cfg.data = j.at("data").get<std::vector<std::string>>();
    if (cfg.data.empty())
        throw InputValidationError("config: 'data' lists no series");

    if (j.contains("prior")) {
        Vector p = vector_from_json(j.at("prior"));
        DoubleSigmoidModel::check_parameters(p);
        cfg.prior = p;
    }

    if (j.contains("options")) cfg.options = j.at("options").get<FitOptions>();
    if (j.contains("fixed"))   cfg.options.fixed = j.at("fixed").get<std::vector<bool>>();
    if (j.contains("output"))  cfg.output = j.at("output").get<OutputConfig>();

    validate(cfg.options);
    return cfg;
}

} // namespace seasonfit
