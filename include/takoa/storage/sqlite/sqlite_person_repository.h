#pragma once

#include "takoa/storage/repositories.h"
#include "takoa/storage/sqlite/sqlite_db.h"

#include <memory>

namespace takoa::storage::sqlite {

// SqlitePersonRepository stores one row per person in the persons table.
// Traits, interests and both vectors are JSON text columns; a person without
// semantic memory has NULL in semantic_memory_json.
class SqlitePersonRepository final : public IPersonRepository {
 public:
  // db must have schema v1 applied.
  explicit SqlitePersonRepository(std::shared_ptr<SqliteDb> db);

  void upsert(const domain::PersonRecord& record) override;
  [[nodiscard]] std::optional<domain::PersonRecord> get(
      const core::PersonId& id) const override;
  [[nodiscard]] std::vector<domain::PersonRecord> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace takoa::storage::sqlite
