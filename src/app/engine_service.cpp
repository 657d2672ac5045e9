#include "takoa/app/engine_service.h"

#include "takoa/domain/person.h"

#include <nlohmann/json.hpp>

namespace takoa::app {

namespace {

std::vector<std::string> id_strings(const std::vector<core::PersonId>& ids) {
  std::vector<std::string> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    out.push_back(id.value);
  }
  return out;
}

void emit(core::Services& services, core::IIdGenerator& id_gen, core::IClock& clock,
          const std::string& trace_id, const std::string& event_type,
          const nlohmann::json& payload, std::vector<std::string> refs) {
  services.audit_log.append({id_gen.next("evt"), trace_id, event_type, payload.dump(),
                             clock.now_iso8601(), std::move(refs)});
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Onboarding Pipeline
// ────────────────────────────────────────────────────────────────

core::Result<OnboardingResponse, core::EngineError> run_onboarding_pipeline(
    const OnboardingRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock) {
  using R = core::Result<OnboardingResponse, core::EngineError>;

  const std::string trace_id = req.trace_id.value_or(core::new_trace_id(id_gen).value);

  engine::OnboardingInput input = req.input;
  if (input.id.value.empty()) {
    input.id = core::new_person_id(id_gen);
  }

  emit(services, id_gen, clock, trace_id, "OnboardingStarted",
       {{"person_id", input.id.value}, {"interest_count", input.interests.size()}},
       {input.id.value});

  auto created = services.store.onboard(input);
  if (!created.has_value()) {
    emit(services, id_gen, clock, trace_id, "OnboardingRejected",
         {{"error_kind", core::to_string(created.error().kind)},
          {"message", created.error().message}},
         {input.id.value});
    return R::err(created.error());
  }

  const domain::PersonRecord& record = created.value().record;
  const bool used_fallback = created.value().used_embedding_fallback;
  services.persons.upsert(record);

  if (used_fallback) {
    emit(services, id_gen, clock, trace_id, "EmbeddingFallbackUsed", {{"stage", "onboarding"}},
         {record.id.value});
  }

  emit(services, id_gen, clock, trace_id, "PersonOnboarded",
       {{"person_id", record.id.value},
        {"interests", record.interests},
        {"confidence", record.confidence},
        {"vector_dim", record.profile_vector.size()}},
       {record.id.value});

  return R::ok(OnboardingResponse{trace_id, record, used_fallback});
}

// ────────────────────────────────────────────────────────────────
// Turn Pipeline
// ────────────────────────────────────────────────────────────────

core::Result<TurnResponse, core::EngineError> run_turn_pipeline(const TurnRequest& req,
                                                                core::Services& services,
                                                                core::IIdGenerator& id_gen,
                                                                core::IClock& clock) {
  using R = core::Result<TurnResponse, core::EngineError>;

  const std::string trace_id = req.trace_id.value_or(core::new_trace_id(id_gen).value);
  const std::string& person = req.input.id.value;

  nlohmann::json signal_names = nlohmann::json::array();
  for (const auto& [name, magnitude] : req.input.signals) {
    signal_names.push_back(name);
  }
  emit(services, id_gen, clock, trace_id, "TurnStarted",
       {{"person_id", person},
        {"signals", signal_names},
        {"confidence", req.input.confidence},
        {"has_message", req.input.message.has_value()}},
       {person});

  auto applied = services.store.apply_turn(req.input);
  if (!applied.has_value()) {
    emit(services, id_gen, clock, trace_id, "TurnRejected",
         {{"error_kind", core::to_string(applied.error().kind)},
          {"message", applied.error().message}},
         {person});
    return R::err(applied.error());
  }

  const engine::TurnOutcome& outcome = applied.value();
  services.persons.upsert(outcome.record);

  emit(services, id_gen, clock, trace_id, "TraitsUpdated",
       {{"before", domain::traits_to_json(outcome.previous_traits)},
        {"after", domain::traits_to_json(outcome.record.traits)},
        {"created", outcome.created}},
       {person});

  if (outcome.used_embedding_fallback) {
    emit(services, id_gen, clock, trace_id, "EmbeddingFallbackUsed", {{"stage", "turn_message"}},
         {person});
  }

  emit(services, id_gen, clock, trace_id, "ProfileVectorUpdated",
       {{"adopted_candidate", outcome.adopted_candidate},
        {"confidence", outcome.record.confidence}},
       {person});

  emit(services, id_gen, clock, trace_id, "TurnCompleted", {{"status", "success"}}, {person});

  return R::ok(TurnResponse{trace_id, outcome});
}

// ────────────────────────────────────────────────────────────────
// Store Initialization
// ────────────────────────────────────────────────────────────────

engine::InitReport load_store_from_repository(core::Services& services,
                                              core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id = core::new_trace_id(id_gen).value;

  engine::InitReport report = services.store.init(services.persons.list_all());

  for (const auto& id : report.recomputed) {
    if (auto record = services.store.get(id); record.has_value()) {
      services.persons.upsert(record.value());
    }
  }

  if (report.used_embedding_fallback) {
    emit(services, id_gen, clock, trace_id, "EmbeddingFallbackUsed",
         {{"stage", "store_init"}}, id_strings(report.recomputed));
  }

  emit(services, id_gen, clock, trace_id, "StoreInitialized",
       {{"loaded", report.loaded}, {"recomputed", id_strings(report.recomputed)}},
       id_strings(report.recomputed));

  return report;
}

}  // namespace takoa::app
