#include "seasonfit/ModelRegistry.hpp"
#include "seasonfit/Models.hpp"
#include "seasonfit/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace seasonfit {

ModelRegistry::ModelRegistry()
{
    models_[static_cast<std::size_t>(ModelKind::Gaussian)] =
        std::make_unique<GaussianModel>();
    models_[static_cast<std::size_t>(ModelKind::HyperbolicTangent)] =
        std::make_unique<HyperbolicTangentModel>();
    models_[static_cast<std::size_t>(ModelKind::Logistic)] =
        std::make_unique<LogisticModel>();
    models_[static_cast<std::size_t>(ModelKind::Sine)] =
        std::make_unique<SineModel>();
}

const ModelRegistry& ModelRegistry::instance()
{
    static const ModelRegistry registry;
    return registry;
}

const DoubleSigmoidModel& ModelRegistry::get(ModelKind kind) const
{
    const auto idx = static_cast<std::size_t>(kind);
    if (idx >= kNModels || !models_[idx])
        throw InputValidationError(
            "no model registered for id " + std::to_string(idx));
    return *models_[idx];
}

std::vector<ModelKind> ModelRegistry::kinds() const
{
    return { ModelKind::Gaussian, ModelKind::HyperbolicTangent,
             ModelKind::Logistic, ModelKind::Sine };
}

std::string model_name(ModelKind kind)
{
    switch (kind) {
        case ModelKind::Gaussian:          return "gaussian";
        case ModelKind::HyperbolicTangent: return "tanh";
        case ModelKind::Logistic:          return "logistic";
        case ModelKind::Sine:              return "sine";
    }
    throw InputValidationError("unknown model id " +
                               std::to_string(static_cast<int>(kind)));
}

ModelKind model_kind_from_string(const std::string& name)
{
    static const std::unordered_map<std::string, ModelKind> lut = {
        {"gaussian",           ModelKind::Gaussian},
        {"gauss",              ModelKind::Gaussian},
        {"tanh",               ModelKind::HyperbolicTangent},
        {"hyperbolic_tangent", ModelKind::HyperbolicTangent},
        {"hyperbolictangent",  ModelKind::HyperbolicTangent},
        {"logistic",           ModelKind::Logistic},
        {"sine",               ModelKind::Sine},
        {"sin",                ModelKind::Sine}
    };

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = lut.find(key);
    if (it == lut.end())
        throw InputValidationError("unknown model '" + name + "'");
    return it->second;
}

} // namespace seasonfit
