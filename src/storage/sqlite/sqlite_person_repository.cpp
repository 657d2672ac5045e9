#include "takoa/storage/sqlite/sqlite_person_repository.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <stdexcept>

namespace takoa::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT person_id, display_name, age, institution, traits_json, interests_json,"
    "       confidence, profile_vector_json, semantic_memory_json FROM persons";

domain::PersonRecord read_row(const PreparedStatement& stmt) {
  domain::PersonRecord record;
  record.id = core::PersonId{stmt.column_text(0)};
  record.display_name = stmt.column_text(1);
  record.age = sqlite3_column_int(stmt.get(), 2);
  record.institution = stmt.column_text(3);
  record.traits = domain::traits_from_json(nlohmann::json::parse(stmt.column_text(4)));
  record.interests = nlohmann::json::parse(stmt.column_text(5)).get<std::vector<std::string>>();
  record.confidence = sqlite3_column_double(stmt.get(), 6);
  record.profile_vector = nlohmann::json::parse(stmt.column_text(7)).get<vector::Vector>();
  if (!stmt.column_is_null(8)) {
    record.semantic_memory = nlohmann::json::parse(stmt.column_text(8)).get<vector::Vector>();
  }
  return record;
}

}  // namespace

SqlitePersonRepository::SqlitePersonRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqlitePersonRepository::upsert(const domain::PersonRecord& record) {
  const char* sql = R"(
    INSERT INTO persons
      (person_id, display_name, age, institution, traits_json, interests_json,
       confidence, profile_vector_json, semantic_memory_json)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(person_id) DO UPDATE SET
      display_name = excluded.display_name,
      age = excluded.age,
      institution = excluded.institution,
      traits_json = excluded.traits_json,
      interests_json = excluded.interests_json,
      confidence = excluded.confidence,
      profile_vector_json = excluded.profile_vector_json,
      semantic_memory_json = excluded.semantic_memory_json
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    throw std::runtime_error("persons upsert prepare failed: " + stmt.error());
  }

  const std::string traits = domain::traits_to_json(record.traits).dump();
  const std::string interests = nlohmann::json(record.interests).dump();
  const std::string vec = nlohmann::json(record.profile_vector).dump();

  sqlite3_bind_text(stmt.get(), 1, record.id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, record.display_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 3, record.age);
  sqlite3_bind_text(stmt.get(), 4, record.institution.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, traits.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, interests.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt.get(), 7, record.confidence);
  sqlite3_bind_text(stmt.get(), 8, vec.c_str(), -1, SQLITE_TRANSIENT);
  if (record.semantic_memory.has_value()) {
    const std::string semantic = nlohmann::json(record.semantic_memory.value()).dump();
    sqlite3_bind_text(stmt.get(), 9, semantic.c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt.get(), 9);
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    throw std::runtime_error("persons upsert failed for " + record.id.value + ": " +
                             sqlite3_errmsg(db_->connection()));
  }
}

std::optional<domain::PersonRecord> SqlitePersonRepository::get(const core::PersonId& id) const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " WHERE person_id = ?");
  if (!stmt.is_valid()) {
    throw std::runtime_error("persons select prepare failed: " + stmt.error());
  }
  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    return read_row(stmt);
  }
  return std::nullopt;
}

std::vector<domain::PersonRecord> SqlitePersonRepository::list_all() const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " ORDER BY person_id");
  if (!stmt.is_valid()) {
    throw std::runtime_error("persons select prepare failed: " + stmt.error());
  }

  std::vector<domain::PersonRecord> out;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    out.push_back(read_row(stmt));
  }
  return out;
}

}  // namespace takoa::storage::sqlite
