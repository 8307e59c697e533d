/* ===================================================================== *
 *  include/seasonfit/ModelRegistry.hpp   ––  ModelKind → model object
 * ===================================================================== */
#pragma once
#include "DoubleSigmoidModel.hpp"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace seasonfit {

/*
 * Immutable lookup table holding one instance of every double-S model.
 * Built once on first use; the model objects are stateless, so the
 * registry can be shared freely between threads.
 *
 *     const auto& m = ModelRegistry::instance().get(ModelKind::Sine);
 *     Vector f = m.value(x, p);
 */
class ModelRegistry
{
public:
    static const ModelRegistry& instance();

    const DoubleSigmoidModel& get(ModelKind kind) const;

    /* all registered kinds, in enumeration order */
    std::vector<ModelKind> kinds() const;

private:
    ModelRegistry();

    static constexpr std::size_t kNModels = 4;
    std::array<std::unique_ptr<DoubleSigmoidModel>, kNModels> models_;
};

/* canonical lower-case name ("gaussian", "tanh", "logistic", "sine") */
std::string model_name(ModelKind kind);

/* accepts the canonical names plus a few spellings found in configs;
 * anything else is an InputValidationError                              */
ModelKind model_kind_from_string(const std::string& name);

} // namespace seasonfit
