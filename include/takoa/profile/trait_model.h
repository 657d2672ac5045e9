#pragma once

#include "takoa/core/result.h"
#include "takoa/domain/signal_weights.h"
#include "takoa/domain/traits.h"

#include <map>
#include <string>

namespace takoa::profile {

// Signal name -> magnitude, as produced by the conversational extractor.
using SignalMap = std::map<std::string, double>;

inline constexpr double kMaxSignalMagnitude = 0.5;

// apply_signals nudges a trait profile by one conversational turn.
//
// For each trait: delta = (sum over signals of magnitude * weight) * confidence * trait_step,
// added to the current value and clamped to [0,1]. Magnitudes are clamped to
// [-0.5, 0.5] first, so no trait moves by more than
// trait_step * 0.5 * (sum of |weights| touching it) in one call.
//
// Unknown signal names are ignored. Errors (kValidation): confidence outside [0,1],
// non-finite confidence, non-finite magnitude, trait_step outside [0,1].
[[nodiscard]] core::Result<domain::TraitProfile, core::EngineError> apply_signals(
    const domain::TraitProfile& current, const SignalMap& signals, double confidence,
    const domain::SignalWeightTable& table, double trait_step = 0.2);

}  // namespace takoa::profile
