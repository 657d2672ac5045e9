#include "takoa/storage/sqlite/sqlite_db.h"
#include "takoa/storage/sqlite/sqlite_person_repository.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

using namespace takoa;
using storage::sqlite::SqliteDb;
using storage::sqlite::SqlitePersonRepository;

namespace {

std::shared_ptr<SqliteDb> open_memory_db() {
  auto db_result = SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());
  return db;
}

domain::PersonRecord make_person(const std::string& id) {
  domain::PersonRecord r;
  r.id = core::PersonId{id};
  r.display_name = "Name " + id;
  r.age = 22;
  r.institution = "State";
  r.traits = domain::TraitProfile({0.7, 0.4, 0.6, 0.5, 0.2});
  r.interests = {"chess", "jazz"};
  r.confidence = 0.45;
  r.profile_vector = {0.6f, 0.8f, 0.0f};
  r.semantic_memory = vector::Vector{0.0f, 1.0f};
  return r;
}

}  // namespace

TEST_CASE("SqliteDb schema is idempotent", "[sqlite][schema]") {
  auto db = open_memory_db();
  CHECK(db->get_schema_version() == 1);
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("SqlitePersonRepository upsert and get restore every field", "[sqlite][persons]") {
  auto db = open_memory_db();
  SqlitePersonRepository repo(db);

  const auto original = make_person("alice");
  repo.upsert(original);

  const auto loaded = repo.get(core::PersonId{"alice"});
  REQUIRE(loaded.has_value());
  CHECK(loaded->display_name == "Name alice");
  CHECK(loaded->age == 22);
  CHECK(loaded->institution == "State");
  CHECK(loaded->traits == original.traits);
  CHECK(loaded->interests == original.interests);
  CHECK(loaded->confidence == 0.45);
  CHECK(loaded->profile_vector == original.profile_vector);
  REQUIRE(loaded->semantic_memory.has_value());
  CHECK(loaded->semantic_memory.value() == original.semantic_memory.value());

  CHECK_FALSE(repo.get(core::PersonId{"nobody"}).has_value());
}

TEST_CASE("SqlitePersonRepository stores a missing semantic memory as NULL", "[sqlite][persons]") {
  auto db = open_memory_db();
  SqlitePersonRepository repo(db);

  auto record = make_person("bob");
  record.semantic_memory.reset();
  repo.upsert(record);

  const auto loaded = repo.get(core::PersonId{"bob"});
  REQUIRE(loaded.has_value());
  CHECK_FALSE(loaded->semantic_memory.has_value());
}

TEST_CASE("SqlitePersonRepository upsert updates in place", "[sqlite][persons]") {
  auto db = open_memory_db();
  SqlitePersonRepository repo(db);

  auto record = make_person("alice");
  repo.upsert(record);
  record.confidence = 0.9;
  record.interests.push_back("surfing");
  repo.upsert(record);

  const auto all = repo.list_all();
  REQUIRE(all.size() == 1);
  CHECK(all[0].confidence == 0.9);
  CHECK(all[0].interests.size() == 3);
}

TEST_CASE("SqlitePersonRepository list_all is ordered by id", "[sqlite][persons]") {
  auto db = open_memory_db();
  SqlitePersonRepository repo(db);
  repo.upsert(make_person("zed"));
  repo.upsert(make_person("amy"));
  repo.upsert(make_person("kim"));

  const auto all = repo.list_all();
  REQUIRE(all.size() == 3);
  CHECK(all[0].id.value == "amy");
  CHECK(all[1].id.value == "kim");
  CHECK(all[2].id.value == "zed");
}

TEST_CASE("SqlitePersonRepository rejects out-of-range confidence", "[sqlite][persons]") {
  auto db = open_memory_db();
  SqlitePersonRepository repo(db);

  auto record = make_person("alice");
  record.confidence = 1.5;
  CHECK_THROWS_AS(repo.upsert(record), std::runtime_error);
  CHECK(repo.list_all().empty());
}

TEST_CASE("SqlitePersonRepository survives reopening the file", "[sqlite][persons]") {
  const auto path = std::filesystem::temp_directory_path() / "takoa_persons_reopen_test.db";
  std::filesystem::remove(path);

  {
    auto db = SqliteDb::open(path.string()).value();
    REQUIRE(db->ensure_schema_v1().has_value());
    SqlitePersonRepository repo(db);
    repo.upsert(make_person("alice"));
  }
  {
    auto db = SqliteDb::open(path.string()).value();
    REQUIRE(db->ensure_schema_v1().has_value());
    SqlitePersonRepository repo(db);
    const auto loaded = repo.get(core::PersonId{"alice"});
    REQUIRE(loaded.has_value());
    CHECK(loaded->confidence == 0.45);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}
