#include "takoa/matching/explainer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace takoa;
using Catch::Matchers::WithinAbs;

namespace {

domain::PersonRecord person(const std::string& id, vector::Vector v,
                            std::vector<std::string> interests = {},
                            std::optional<vector::Vector> semantic = std::nullopt) {
  domain::PersonRecord r;
  r.id = core::PersonId{id};
  r.profile_vector = std::move(v);
  r.interests = std::move(interests);
  r.semantic_memory = std::move(semantic);
  return r;
}

}  // namespace

TEST_CASE("agreement_contribution rewards high agreeing values", "[matching][explain]") {
  CHECK_THAT(matching::agreement_contribution(0.8, 0.8), WithinAbs(0.64, 1e-12));
  CHECK_THAT(matching::agreement_contribution(0.9, 0.1), WithinAbs(0.018, 1e-12));
  CHECK(matching::agreement_contribution(0.0, 0.9) == 0.0);
}

TEST_CASE("explain similarity equals cosine of the profile vectors", "[matching][explain]") {
  const vector::Vector va = vector::normalize({0.6f, 0.2f, 0.5f, 0.3f, 0.1f, 0.4f});
  const vector::Vector vb = vector::normalize({0.5f, 0.3f, 0.1f, 0.6f, 0.2f, 0.2f});
  const engine::StoreSnapshot snap({person("a", va), person("b", vb)});

  const auto ex = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"b"});
  REQUIRE(ex.has_value());
  CHECK(ex.value().similarity == vector::cosine(va, vb).value());
  CHECK(ex.value().contributions.size() == 5);
  for (std::size_t i = 1; i < ex.value().contributions.size(); ++i) {
    CHECK(ex.value().contributions[i - 1].value >= ex.value().contributions[i].value);
  }
}

TEST_CASE("explain flags a zero profile vector as insufficient data", "[matching][explain]") {
  const vector::Vector va = vector::normalize({0.6f, 0.2f, 0.5f, 0.3f, 0.1f, 0.4f});
  const engine::StoreSnapshot snap(
      {person("a", va), person("z", vector::Vector(6, 0.0f)), person("c", va)});

  const auto ex = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"z"});
  REQUIRE(ex.has_value());
  CHECK(ex.value().similarity == 0.0);
  CHECK(ex.value().insufficient_data);

  const auto ok = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"c"});
  REQUIRE(ok.has_value());
  CHECK_FALSE(ok.value().insufficient_data);
}

TEST_CASE("explain for orthogonal people", "[matching][explain]") {
  const engine::StoreSnapshot snap({
      person("a", {1.0f, 0.0f, 0.0f, 0.0f, 0.0f}),
      person("b", {0.0f, 1.0f, 0.0f, 0.0f, 0.0f}),
  });
  const auto ex = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"b"});
  REQUIRE(ex.has_value());
  CHECK(ex.value().similarity == 0.0);
  CHECK(ex.value().shared_interest_tags.empty());
  for (const auto& c : ex.value().contributions) {
    CHECK(c.value == 0.0);
  }
}

TEST_CASE("explain adds a bonus per shared interest", "[matching][explain]") {
  const engine::StoreSnapshot snap({
      person("a", {0.1f, 0.1f, 0.1f, 0.1f, 0.1f}, {"chess", "hiking", "jazz"}),
      person("b", {0.1f, 0.1f, 0.1f, 0.1f, 0.1f}, {"hiking", "jazz", "surfing"}),
  });
  const auto ex = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"b"},
                                    matching::ExplainOptions{0.15, 3});
  REQUIRE(ex.has_value());
  CHECK(ex.value().shared_interest_tags == std::vector<std::string>{"hiking", "jazz"});
  REQUIRE(ex.value().contributions.size() == 3);
  CHECK(ex.value().contributions[0].label == "interest:hiking");
  CHECK(ex.value().contributions[0].source == domain::ContributionSource::kSharedInterest);
  CHECK(ex.value().contributions[1].label == "interest:jazz");
}

TEST_CASE("explain labels semantic dimensions from one", "[matching][explain]") {
  const engine::StoreSnapshot snap({
      person("a", {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f}, {}, vector::Vector{0.9f, 0.0f}),
      person("b", {0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 1.0f}, {}, vector::Vector{0.9f, 0.0f}),
  });
  const auto ex = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"b"});
  REQUIRE(ex.has_value());
  REQUIRE_FALSE(ex.value().contributions.empty());
  CHECK(ex.value().contributions[0].label == "interest_embedding_1");
  CHECK(ex.value().contributions[0].source == domain::ContributionSource::kSemantic);
}

TEST_CASE("explain errors", "[matching][explain]") {
  const engine::StoreSnapshot snap({
      person("a", {1.0f, 0.0f}),
      person("b", {1.0f, 0.0f, 0.0f}),
  });
  const auto missing = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"ghost"});
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == core::ErrorKind::kNotFound);

  const auto mismatch = matching::explain(snap, core::PersonId{"a"}, core::PersonId{"b"});
  REQUIRE_FALSE(mismatch.has_value());
  CHECK(mismatch.error().kind == core::ErrorKind::kValidation);
}
