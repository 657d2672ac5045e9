#include "takoa/domain/traits.h"

#include <algorithm>
#include <cmath>

namespace takoa::domain {

namespace {

constexpr std::array<std::string_view, kTraitCount> kTraitNames = {
    "openness", "conscientiousness", "extraversion", "agreeableness", "neuroticism",
};

}  // namespace

std::string_view trait_name(const Trait trait) {
  return kTraitNames[static_cast<std::size_t>(trait)];
}

std::optional<Trait> trait_from_name(const std::string_view name) {
  for (const Trait trait : kAllTraits) {
    if (trait_name(trait) == name) {
      return trait;
    }
  }
  return std::nullopt;
}

double clamp_unit(const double value) {
  if (std::isnan(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

TraitProfile::TraitProfile() {
  values_.fill(kDefaultTraitValue);
}

TraitProfile::TraitProfile(const Values& values) {
  for (std::size_t i = 0; i < kTraitCount; ++i) {
    values_[i] = clamp_unit(values[i]);
  }
}

}  // namespace takoa::domain
