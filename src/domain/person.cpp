#include "takoa/domain/person.h"

namespace takoa::domain {

nlohmann::json traits_to_json(const TraitProfile& traits) {
  nlohmann::json j = nlohmann::json::object();
  for (const Trait trait : kAllTraits) {
    j[std::string(trait_name(trait))] = traits.value(trait);
  }
  return j;
}

TraitProfile traits_from_json(const nlohmann::json& j) {
  TraitProfile::Values values{};
  for (const Trait trait : kAllTraits) {
    values[static_cast<std::size_t>(trait)] =
        j.value(std::string(trait_name(trait)), kDefaultTraitValue);
  }
  return TraitProfile(values);
}

nlohmann::json person_to_json(const PersonRecord& record) {
  nlohmann::json j;
  j["id"] = record.id.value;
  j["name"] = record.display_name;
  j["age"] = record.age;
  j["uni"] = record.institution;
  j["traits"] = traits_to_json(record.traits);
  j["interests"] = record.interests;
  j["confidence"] = record.confidence;
  j["vector"] = record.profile_vector;
  if (record.semantic_memory.has_value()) {
    j["semantic"] = record.semantic_memory.value();
  }
  return j;
}

PersonRecord person_from_json(const nlohmann::json& j) {
  PersonRecord record;
  record.id = core::PersonId{j.at("id").get<std::string>()};
  record.display_name = j.value("name", std::string(kDefaultDisplayName));
  record.age = j.value("age", kDefaultAge);
  record.institution = j.value("uni", std::string(kDefaultInstitution));

  if (j.contains("traits") && j["traits"].is_object()) {
    record.traits = traits_from_json(j["traits"]);
  }
  record.interests = j.value("interests", std::vector<std::string>{});

  // Stored records predating confidence tracking get the onboarding default.
  if (j.contains("confidence") && j["confidence"].is_number()) {
    record.confidence = clamp_unit(j["confidence"].get<double>());
  } else {
    record.confidence = kDefaultConfidence;
  }

  record.profile_vector = j.value("vector", vector::Vector{});
  if (j.contains("semantic") && j["semantic"].is_array()) {
    record.semantic_memory = j["semantic"].get<vector::Vector>();
  }
  return record;
}

}  // namespace takoa::domain
