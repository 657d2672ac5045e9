#include "takoa/matching/retrieval.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace takoa;
using Catch::Matchers::WithinAbs;

namespace {

domain::PersonRecord person(const std::string& id, vector::Vector v) {
  domain::PersonRecord r;
  r.id = core::PersonId{id};
  r.profile_vector = vector::normalize(v);
  return r;
}

engine::StoreSnapshot sample_snapshot() {
  return engine::StoreSnapshot({
      person("a", {1.0f, 0.0f, 0.0f}),
      person("b", {0.9f, 0.1f, 0.0f}),
      person("c", {0.0f, 1.0f, 0.0f}),
      person("d", {-1.0f, 0.0f, 0.0f}),
      person("e", {0.9f, 0.1f, 0.0f}),
      person("z", {0.0f, 0.0f, 0.0f}),
  });
}

}  // namespace

TEST_CASE("k_nearest ranks by similarity and excludes the query", "[matching][retrieval]") {
  const auto snap = sample_snapshot();
  const auto result = matching::k_nearest(snap, core::PersonId{"a"}, 10);
  REQUIRE(result.has_value());

  const auto& n = result.value().neighbors;
  REQUIRE(n.size() == 4);  // zero-vector "z" is skipped
  for (const auto& neighbor : n) {
    CHECK(neighbor.id.value != "a");
  }
  for (std::size_t i = 1; i < n.size(); ++i) {
    CHECK(n[i - 1].similarity >= n[i].similarity);
  }
  // b and e tie exactly; ascending id breaks it.
  CHECK(n[0].id.value == "b");
  CHECK(n[1].id.value == "e");
  CHECK(n[3].id.value == "d");
  CHECK_THAT(n[3].similarity, WithinAbs(-1.0, 1e-6));
}

TEST_CASE("k_nearest truncates to k", "[matching][retrieval]") {
  const auto snap = sample_snapshot();
  const auto result = matching::k_nearest(snap, core::PersonId{"a"}, 2);
  REQUIRE(result.has_value());
  CHECK(result.value().neighbors.size() == 2);

  const auto none = matching::k_nearest(snap, core::PersonId{"a"}, 0);
  REQUIRE(none.has_value());
  CHECK(none.value().neighbors.empty());
}

TEST_CASE("k_nearest for a zero vector reports insufficient data", "[matching][retrieval]") {
  const auto snap = sample_snapshot();
  const auto result = matching::k_nearest(snap, core::PersonId{"z"}, 5);
  REQUIRE(result.has_value());
  CHECK(result.value().insufficient_data);
  CHECK(result.value().neighbors.empty());
}

TEST_CASE("k_nearest errors", "[matching][retrieval]") {
  const auto snap = sample_snapshot();
  const auto missing = matching::k_nearest(snap, core::PersonId{"nobody"}, 5);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == core::ErrorKind::kNotFound);

  const engine::StoreSnapshot mixed({person("a", {1.0f, 0.0f}), person("b", {1.0f, 0.0f, 0.0f})});
  const auto mismatch = matching::k_nearest(mixed, core::PersonId{"a"}, 5);
  REQUIRE_FALSE(mismatch.has_value());
  CHECK(mismatch.error().kind == core::ErrorKind::kValidation);
}

TEST_CASE("k_nearest on a single-person snapshot is empty", "[matching][retrieval]") {
  const engine::StoreSnapshot snap({person("solo", {1.0f, 0.0f})});
  const auto result = matching::k_nearest(snap, core::PersonId{"solo"}, 5);
  REQUIRE(result.has_value());
  CHECK(result.value().neighbors.empty());
  CHECK_FALSE(result.value().insufficient_data);
}

TEST_CASE("group_cohesion is the mean pairwise similarity", "[matching][cohesion]") {
  const auto snap = sample_snapshot();
  // cos(a,c) = 0, cos(a,d) = -1, cos(c,d) = 0
  const auto cohesion = matching::group_cohesion(
      snap, {core::PersonId{"a"}, core::PersonId{"c"}, core::PersonId{"d"}});
  REQUIRE(cohesion.has_value());
  CHECK_THAT(cohesion.value(), WithinAbs(-1.0 / 3.0, 1e-6));
}

TEST_CASE("group_cohesion needs two distinct known people", "[matching][cohesion]") {
  const auto snap = sample_snapshot();
  CHECK_FALSE(matching::group_cohesion(snap, {core::PersonId{"a"}}).has_value());
  CHECK_FALSE(
      matching::group_cohesion(snap, {core::PersonId{"a"}, core::PersonId{"a"}}).has_value());

  const auto missing =
      matching::group_cohesion(snap, {core::PersonId{"a"}, core::PersonId{"ghost"}});
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().kind == core::ErrorKind::kNotFound);
}
