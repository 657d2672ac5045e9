#include "takoa/profile/trait_model.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace takoa::profile {

core::Result<domain::TraitProfile, core::EngineError> apply_signals(
    const domain::TraitProfile& current, const SignalMap& signals, const double confidence,
    const domain::SignalWeightTable& table, const double trait_step) {
  using R = core::Result<domain::TraitProfile, core::EngineError>;

  if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
    return R::err(core::validation_error("confidence must be in [0,1], got " +
                                         std::to_string(confidence)));
  }
  if (!std::isfinite(trait_step) || trait_step < 0.0 || trait_step > 1.0) {
    return R::err(core::validation_error("trait_step must be in [0,1]"));
  }

  std::array<double, domain::kTraitCount> deltas{};
  for (const auto& [name, magnitude] : signals) {
    if (!std::isfinite(magnitude)) {
      return R::err(core::validation_error("signal '" + name + "' has a non-finite magnitude"));
    }
    const auto* weights = table.find(name);
    if (weights == nullptr) {
      continue;
    }
    const double m = std::clamp(magnitude, -kMaxSignalMagnitude, kMaxSignalMagnitude);
    for (const auto& tw : *weights) {
      deltas[static_cast<std::size_t>(tw.trait)] += m * tw.weight;
    }
  }

  const double step = confidence * trait_step;
  domain::TraitProfile::Values next = current.values();
  for (std::size_t i = 0; i < domain::kTraitCount; ++i) {
    next[i] += deltas[i] * step;
  }

  return R::ok(domain::TraitProfile(next));
}

}  // namespace takoa::profile
