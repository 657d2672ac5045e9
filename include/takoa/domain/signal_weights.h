#pragma once

#include "takoa/core/result.h"
#include "takoa/domain/traits.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace takoa::domain {

struct TraitWeight {
  Trait trait;    // NOLINT(readability-identifier-naming)
  double weight;  // NOLINT(readability-identifier-naming)
};

// SignalWeightTable maps a conversational signal name to the traits it nudges.
// Built once (defaults or JSON) and read-only afterwards; safe to share across threads.
class SignalWeightTable {
 public:
  explicit SignalWeightTable(std::map<std::string, std::vector<TraitWeight>, std::less<>> entries);

  // Hand-authored table used when no override is configured.
  [[nodiscard]] static SignalWeightTable defaults();

  // Expected shape: {"signal": {"openness": 0.4, "conscientiousness": -0.5}, ...}
  // Unknown trait names and non-numeric weights are validation errors.
  [[nodiscard]] static core::Result<SignalWeightTable, core::EngineError> from_json(
      const nlohmann::json& j);

  // Returns nullptr for signals the table does not know.
  [[nodiscard]] const std::vector<TraitWeight>* find(std::string_view signal) const;

  // Sum of |weight| over every signal entry touching trait.
  [[nodiscard]] double total_abs_weight(Trait trait) const;

  [[nodiscard]] const std::map<std::string, std::vector<TraitWeight>, std::less<>>& entries()
      const {
    return entries_;
  }

  [[nodiscard]] nlohmann::json to_json() const;

 private:
  std::map<std::string, std::vector<TraitWeight>, std::less<>> entries_;
};

}  // namespace takoa::domain
