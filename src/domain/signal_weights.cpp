#include "takoa/domain/signal_weights.h"

#include <cmath>

namespace takoa::domain {

SignalWeightTable::SignalWeightTable(
    std::map<std::string, std::vector<TraitWeight>, std::less<>> entries)
    : entries_(std::move(entries)) {}

SignalWeightTable SignalWeightTable::defaults() {
  return SignalWeightTable({
      {"spontaneity", {{Trait::kOpenness, 0.4}, {Trait::kConscientiousness, -0.5}}},
      {"planning_preference", {{Trait::kConscientiousness, 0.5}}},
      {"social_energy", {{Trait::kExtraversion, 0.6}}},
      {"curiosity", {{Trait::kOpenness, 0.6}}},
      {"introspection", {{Trait::kOpenness, 0.2}, {Trait::kExtraversion, -0.3}}},
      {"nature_orientation", {{Trait::kOpenness, 0.2}, {Trait::kAgreeableness, 0.2}}},
      {"novelty_seeking", {{Trait::kOpenness, 0.5}}},
  });
}

core::Result<SignalWeightTable, core::EngineError> SignalWeightTable::from_json(
    const nlohmann::json& j) {
  using R = core::Result<SignalWeightTable, core::EngineError>;

  if (!j.is_object()) {
    return R::err(core::validation_error("signal weight table must be a JSON object"));
  }

  std::map<std::string, std::vector<TraitWeight>, std::less<>> entries;
  for (const auto& [signal, weights] : j.items()) {
    if (!weights.is_object()) {
      return R::err(core::validation_error("weights for signal '" + signal +
                                           "' must be an object of trait -> weight"));
    }

    std::vector<TraitWeight> trait_weights;
    for (const auto& [name, weight] : weights.items()) {
      const auto trait = trait_from_name(name);
      if (!trait.has_value()) {
        return R::err(
            core::validation_error("unknown trait '" + name + "' in signal '" + signal + "'"));
      }
      if (!weight.is_number() || !std::isfinite(weight.get<double>())) {
        return R::err(core::validation_error("weight for '" + signal + "." + name +
                                             "' must be a finite number"));
      }
      trait_weights.push_back(TraitWeight{*trait, weight.get<double>()});
    }
    entries.emplace(signal, std::move(trait_weights));
  }

  return R::ok(SignalWeightTable(std::move(entries)));
}

const std::vector<TraitWeight>* SignalWeightTable::find(const std::string_view signal) const {
  const auto it = entries_.find(signal);
  return it == entries_.end() ? nullptr : &it->second;
}

double SignalWeightTable::total_abs_weight(const Trait trait) const {
  double total = 0.0;
  for (const auto& [signal, weights] : entries_) {
    for (const auto& tw : weights) {
      if (tw.trait == trait) {
        total += std::abs(tw.weight);
      }
    }
  }
  return total;
}

nlohmann::json SignalWeightTable::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [signal, weights] : entries_) {
    nlohmann::json w = nlohmann::json::object();
    for (const auto& tw : weights) {
      w[std::string(trait_name(tw.trait))] = tw.weight;
    }
    j[signal] = w;
  }
  return j;
}

}  // namespace takoa::domain
