#include "takoa/app/engine_service.h"
#include "takoa/matching/explainer.h"
#include "takoa/matching/retrieval.h"
#include "takoa/projection/umap_projector.h"
#include "takoa/storage/audit_log.h"
#include "takoa/storage/sqlite/sqlite_audit_log.h"
#include "takoa/storage/sqlite/sqlite_db.h"
#include "takoa/storage/sqlite/sqlite_person_repository.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace takoa;
using Catch::Matchers::WithinAbs;

namespace {

struct Engine {
  domain::EngineConfig config;
  domain::SignalWeightTable table = domain::SignalWeightTable::defaults();
  embedding::HashEmbeddingProvider provider{16};
  embedding::EmbeddingSource source{nullptr, provider};
  engine::ProfileStore store{config, table, source};
};

engine::OnboardingInput onboarding(const std::string& id, std::vector<std::string> interests,
                                   double confidence = domain::kDefaultConfidence) {
  engine::OnboardingInput input;
  input.id = core::PersonId{id};
  input.interests = std::move(interests);
  input.confidence = confidence;
  return input;
}

}  // namespace

TEST_CASE("identical inputs give identical vectors in independent engines", "[scenario]") {
  Engine first;
  Engine second;
  const auto a = first.store.onboard(onboarding("a", {}, 0.0)).value().record;
  const auto b = second.store.onboard(onboarding("b", {}, 0.0)).value().record;
  CHECK(a.profile_vector == b.profile_vector);

  engine::TurnInput turn{core::PersonId{"a"}, {{"curiosity", 0.3}}, 0.6,
                         std::string("museum trip on sunday")};
  const auto ta = first.store.apply_turn(turn).value();
  turn.id = core::PersonId{"b"};
  const auto tb = second.store.apply_turn(turn).value();
  CHECK(ta.record.profile_vector == tb.record.profile_vector);
}

TEST_CASE("a social energy signal raises extraversion and nothing else", "[scenario]") {
  Engine e;
  const auto before = e.store.onboard(onboarding("a", {"games"})).value().record;

  engine::TurnInput turn{core::PersonId{"a"}, {{"social_energy", 0.4}}, 0.8, std::nullopt};
  const auto after = e.store.apply_turn(turn).value().record;

  using domain::Trait;
  CHECK(after.traits.value(Trait::kExtraversion) > before.traits.value(Trait::kExtraversion));
  for (const Trait t : {Trait::kOpenness, Trait::kConscientiousness, Trait::kAgreeableness,
                        Trait::kNeuroticism}) {
    CHECK(after.traits.value(t) == before.traits.value(t));
  }
}

TEST_CASE("orthogonal people without shared interests explain to zero", "[scenario]") {
  domain::PersonRecord a;
  a.id = core::PersonId{"a"};
  a.profile_vector = {1.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f};
  a.interests = {"chess"};
  domain::PersonRecord b;
  b.id = core::PersonId{"b"};
  b.profile_vector = {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f};
  b.interests = {"surfing"};

  const engine::StoreSnapshot snap({a, b});
  const auto ex = matching::explain(snap, a.id, b.id).value();
  CHECK_THAT(ex.similarity, WithinAbs(0.0, 1e-9));
  CHECK(ex.shared_interest_tags.empty());
}

TEST_CASE("a small population projects into the flagged fallback cube", "[scenario]") {
  Engine e;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(e.store.onboard(onboarding("p" + std::to_string(i), {"topic"})).has_value());
  }

  projection::ProjectionParams params;
  params.n_neighbors = e.config.projection_neighbors;
  const auto result = projection::UmapProjector(params).project(e.store.snapshot().vectors());
  REQUIRE(result.has_value());
  CHECK(result.value().fallback);
  for (const auto& p : result.value().coordinates) {
    for (const double c : p) {
      CHECK(c >= -1.0);
      CHECK(c <= 1.0);
    }
  }
}

TEST_CASE("people with shared interests rank above strangers", "[scenario]") {
  Engine e;
  REQUIRE(e.store.onboard(onboarding("ana", {"rock climbing", "hiking", "camping"})).has_value());
  REQUIRE(e.store.onboard(onboarding("ben", {"hiking", "camping", "rock climbing"})).has_value());
  REQUIRE(e.store.onboard(onboarding("cai", {"opera", "ballet"})).has_value());

  const auto result = matching::k_nearest(e.store.snapshot(), core::PersonId{"ana"}, 2).value();
  REQUIRE(result.neighbors.size() == 2);
  CHECK(result.neighbors[0].id.value == "ben");
  CHECK(result.neighbors[0].similarity > result.neighbors[1].similarity);
}

TEST_CASE("many confident turns converge toward the signalled traits", "[scenario]") {
  Engine e;
  REQUIRE(e.store.onboard(onboarding("a", {})).has_value());

  double previous = 0.5;
  for (int i = 0; i < 10; ++i) {
    engine::TurnInput turn{core::PersonId{"a"}, {{"social_energy", 0.5}}, 1.0, std::nullopt};
    const auto out = e.store.apply_turn(turn).value();
    const double current = out.record.traits.value(domain::Trait::kExtraversion);
    CHECK(current >= previous);
    previous = current;
  }
  CHECK(previous == 1.0);
}

TEST_CASE("state survives a restart through SQLite", "[scenario][sqlite]") {
  auto db = storage::sqlite::SqliteDb::open(":memory:").value();
  REQUIRE(db->ensure_schema_v1().has_value());
  storage::sqlite::SqlitePersonRepository persons(db);
  storage::sqlite::SqliteAuditLog audit_log(db);
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-01-01T00:00:00.000Z");

  std::vector<matching::Neighbor> before;
  {
    Engine e;
    core::Services services(persons, audit_log, e.store);
    for (const auto& [id, tags] : std::vector<std::pair<std::string, std::vector<std::string>>>{
             {"ana", {"chess"}}, {"ben", {"chess", "go"}}, {"cai", {"surfing"}}}) {
      app::OnboardingRequest req;
      req.input = onboarding(id, tags);
      REQUIRE(app::run_onboarding_pipeline(req, services, id_gen, clock).has_value());
    }
    app::TurnRequest turn;
    turn.input = engine::TurnInput{core::PersonId{"ana"}, {{"curiosity", 0.4}}, 0.7,
                                   std::string("found a new opening")};
    REQUIRE(app::run_turn_pipeline(turn, services, id_gen, clock).has_value());
    before = matching::k_nearest(e.store.snapshot(), core::PersonId{"ana"}, 5).value().neighbors;
  }

  Engine restarted;
  core::Services services(persons, audit_log, restarted.store);
  const auto report = app::load_store_from_repository(services, id_gen, clock);
  CHECK(report.loaded == 3);
  CHECK(report.recomputed.empty());

  const auto after =
      matching::k_nearest(restarted.store.snapshot(), core::PersonId{"ana"}, 5).value().neighbors;
  REQUIRE(after.size() == before.size());
  for (std::size_t i = 0; i < after.size(); ++i) {
    CHECK(after[i].id == before[i].id);
    CHECK_THAT(after[i].similarity, WithinAbs(before[i].similarity, 1e-6));
  }
}
