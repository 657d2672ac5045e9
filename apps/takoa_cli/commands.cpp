#include "commands.h"

#include "takoa/app/engine_service.h"
#include "takoa/app/json_views.h"
#include "takoa/app/social_graph.h"
#include "takoa/clustering/dbscan.h"
#include "takoa/domain/person.h"
#include "takoa/matching/explainer.h"
#include "takoa/matching/retrieval.h"
#include "takoa/storage/audit_chain.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace takoa::cli {

namespace {

int report(const core::EngineError& error) {
  std::cerr << "Error (" << core::to_string(error.kind) << "): " << error.message << "\n";
  return 1;
}

void print(const nlohmann::json& j) {
  std::cout << j.dump(2) << "\n";
}

void warn_embedding_fallback(EngineRuntime& rt) {
  std::cerr << "WARNING: embedding provider unavailable, used hash fallback ("
            << rt.embeddings().last_error() << ")\n";
}

}  // namespace

int cmd_onboard(const CliConfig& config, EngineRuntime& rt) {
  app::OnboardingRequest req;
  req.trace_id = config.trace_id;
  req.input.id = core::PersonId{config.id.value_or("")};
  req.input.display_name = config.name.value_or(domain::kDefaultDisplayName);
  req.input.age = config.age.value_or(domain::kDefaultAge);
  req.input.institution = config.institution.value_or(domain::kDefaultInstitution);
  req.input.interests = config.interests;
  req.input.confidence = config.confidence.value_or(domain::kDefaultConfidence);

  if (!config.traits.empty()) {
    domain::TraitProfile::Values values{};
    values.fill(domain::kDefaultTraitValue);
    for (const auto& [name, value] : config.traits) {
      const auto trait = domain::trait_from_name(name);
      if (!trait.has_value()) {
        return report(core::validation_error("unknown trait: " + name));
      }
      values[static_cast<std::size_t>(trait.value())] = value;
    }
    req.input.traits = domain::TraitProfile(values);
  }

  auto res = app::run_onboarding_pipeline(req, rt.services(), rt.id_gen(), rt.clock());
  if (!res.has_value()) {
    return report(res.error());
  }
  if (res.value().used_embedding_fallback) {
    warn_embedding_fallback(rt);
  }
  print({{"trace_id", res.value().trace_id},
         {"used_embedding_fallback", res.value().used_embedding_fallback},
         {"person", domain::person_to_json(res.value().record)}});
  return 0;
}

int cmd_turn(const CliConfig& config, EngineRuntime& rt) {
  app::TurnRequest req;
  req.trace_id = config.trace_id;
  req.input.id = core::PersonId{config.id.value_or("")};
  req.input.signals = profile::SignalMap(config.signals.begin(), config.signals.end());
  req.input.confidence = config.confidence.value_or(0.0);
  req.input.message = config.message;

  auto res = app::run_turn_pipeline(req, rt.services(), rt.id_gen(), rt.clock());
  if (!res.has_value()) {
    return report(res.error());
  }

  const engine::TurnOutcome& outcome = res.value().outcome;
  if (outcome.used_embedding_fallback) {
    warn_embedding_fallback(rt);
  }
  print({{"trace_id", res.value().trace_id},
         {"created", outcome.created},
         {"adopted_candidate", outcome.adopted_candidate},
         {"used_embedding_fallback", outcome.used_embedding_fallback},
         {"person", domain::person_to_json(outcome.record)}});
  return 0;
}

int cmd_neighbors(const CliConfig& config, EngineRuntime& rt) {
  const core::PersonId id{config.id.value_or("")};
  auto res = matching::k_nearest(rt.services().store.snapshot(), id, config.k);
  if (!res.has_value()) {
    return report(res.error());
  }
  print(app::neighbors_to_json(id, res.value()));
  return 0;
}

int cmd_explain(const CliConfig& config, EngineRuntime& rt) {
  const auto snapshot = rt.services().store.snapshot();
  const matching::ExplainOptions options{rt.engine_config().interest_bonus,
                                         rt.engine_config().explain_top_n};
  auto res = matching::explain(snapshot, core::PersonId{config.id.value_or("")},
                               core::PersonId{config.other_id.value_or("")}, options);
  if (!res.has_value()) {
    return report(res.error());
  }
  print(app::explanation_to_json(snapshot, res.value()));
  return 0;
}

int cmd_cohesion(const CliConfig& config, EngineRuntime& rt) {
  std::vector<core::PersonId> ids;
  for (const auto& m : config.members) {
    ids.push_back(core::PersonId{m});
  }
  auto res = matching::group_cohesion(rt.services().store.snapshot(), ids);
  if (!res.has_value()) {
    return report(res.error());
  }
  print({{"members", config.members}, {"cohesion", res.value()}});
  return 0;
}

int cmd_clusters(const CliConfig& /*config*/, EngineRuntime& rt) {
  const auto snapshot = rt.services().store.snapshot();
  auto labels = clustering::dbscan(
      snapshot.vectors(), clustering::DbscanParams{rt.engine_config().dbscan_epsilon,
                                                   rt.engine_config().dbscan_min_points});
  if (!labels.has_value()) {
    return report(labels.error());
  }
  print(app::clusters_to_json(snapshot, labels.value()));
  return 0;
}

int cmd_graph(const CliConfig& config, EngineRuntime& rt) {
  app::GraphOptions options;
  options.mode = app::graph_mode_from_string(config.graph_mode).value_or(app::GraphMode::kForce);
  options.neighbors = config.k;

  auto res = app::run_graph_pipeline(options, rt.services(), rt.id_gen(), rt.clock());
  if (!res.has_value()) {
    return report(res.error());
  }
  if (res.value().value("projection_fallback", false)) {
    std::cerr << "WARNING: fewer persons than projection neighbours; positions are random\n";
  }
  print(res.value());
  return 0;
}

int cmd_export(const CliConfig& /*config*/, EngineRuntime& rt) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : rt.services().store.export_records()) {
    out.push_back(domain::person_to_json(record));
  }
  print(out);
  return 0;
}

int cmd_verify_audit(const CliConfig& config, EngineRuntime& rt) {
  const auto& log = rt.services().audit_log;
  const std::vector<std::string> traces = config.trace_id.has_value()
                                              ? std::vector<std::string>{config.trace_id.value()}
                                              : log.list_trace_ids();

  nlohmann::json broken = nlohmann::json::array();
  for (const auto& trace : traces) {
    const auto check = storage::verify_audit_chain(log.query(trace));
    if (!check.valid) {
      broken.push_back(nlohmann::json{
          {"trace_id", trace}, {"index", check.first_invalid_index}, {"error", check.error}});
    }
  }
  print({{"traces", traces.size()}, {"broken", broken}});
  return broken.empty() ? 0 : 1;
}

}  // namespace takoa::cli
