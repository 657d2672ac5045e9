#include "takoa/storage/inmemory_person_repository.h"

#include <catch2/catch_test_macros.hpp>

using namespace takoa;

namespace {

domain::PersonRecord make_person(const std::string& id, double confidence) {
  domain::PersonRecord r;
  r.id = core::PersonId{id};
  r.confidence = confidence;
  r.profile_vector = {1.0f, 0.0f};
  return r;
}

}  // namespace

TEST_CASE("InMemoryPersonRepository upsert and get", "[storage][inmemory]") {
  storage::InMemoryPersonRepository repo;
  repo.upsert(make_person("alice", 0.3));

  const auto found = repo.get(core::PersonId{"alice"});
  REQUIRE(found.has_value());
  CHECK(found->confidence == 0.3);
  CHECK_FALSE(repo.get(core::PersonId{"bob"}).has_value());
}

TEST_CASE("InMemoryPersonRepository upsert replaces", "[storage][inmemory]") {
  storage::InMemoryPersonRepository repo;
  repo.upsert(make_person("alice", 0.3));
  repo.upsert(make_person("alice", 0.6));

  CHECK(repo.list_all().size() == 1);
  CHECK(repo.get(core::PersonId{"alice"})->confidence == 0.6);
}

TEST_CASE("InMemoryPersonRepository list_all is ordered by id", "[storage][inmemory]") {
  storage::InMemoryPersonRepository repo;
  repo.upsert(make_person("carol", 0.3));
  repo.upsert(make_person("alice", 0.3));
  repo.upsert(make_person("bob", 0.3));

  const auto all = repo.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].id.value == "alice");
  CHECK(all[1].id.value == "bob");
  CHECK(all[2].id.value == "carol");
}
