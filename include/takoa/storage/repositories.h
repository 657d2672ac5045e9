#pragma once

#include "takoa/domain/person.h"

#include <optional>
#include <vector>

namespace takoa::storage {

// Durable home for PersonRecords. The engine keeps its working set in
// engine::ProfileStore; a repository is read at startup and written after
// every accepted onboarding or turn.
class IPersonRepository {
 public:
  virtual ~IPersonRepository() = default;
  // Backend failures throw std::runtime_error.
  virtual void upsert(const domain::PersonRecord& record) = 0;
  [[nodiscard]] virtual std::optional<domain::PersonRecord> get(
      const core::PersonId& id) const = 0;
  // Ordered by person id.
  [[nodiscard]] virtual std::vector<domain::PersonRecord> list_all() const = 0;
};

}  // namespace takoa::storage
