#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace takoa::domain {

enum class Trait {
  kOpenness = 0,
  kConscientiousness = 1,
  kExtraversion = 2,
  kAgreeableness = 3,
  kNeuroticism = 4,
};

inline constexpr std::size_t kTraitCount = 5;
inline constexpr double kDefaultTraitValue = 0.5;

inline constexpr std::array<Trait, kTraitCount> kAllTraits = {
    Trait::kOpenness, Trait::kConscientiousness, Trait::kExtraversion, Trait::kAgreeableness,
    Trait::kNeuroticism,
};

[[nodiscard]] std::string_view trait_name(Trait trait);
[[nodiscard]] std::optional<Trait> trait_from_name(std::string_view name);

// TraitProfile holds the five bounded personality traits.
//
// Every value is clamped to [0,1] on construction and there are no setters: the
// only way to obtain a different profile is to build a new one, which is what the
// signal update in profile/trait_model.h does. Unset traits default to 0.5.
class TraitProfile {
 public:
  using Values = std::array<double, kTraitCount>;

  TraitProfile();
  explicit TraitProfile(const Values& values);

  [[nodiscard]] double value(Trait trait) const { return values_[static_cast<std::size_t>(trait)]; }
  [[nodiscard]] const Values& values() const { return values_; }

  bool operator==(const TraitProfile&) const = default;

 private:
  Values values_;
};

// Clamp to [0,1]; NaN maps to 0.
[[nodiscard]] double clamp_unit(double value);

}  // namespace takoa::domain
