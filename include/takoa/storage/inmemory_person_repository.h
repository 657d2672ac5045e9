#pragma once

#include "takoa/storage/repositories.h"

#include <map>
#include <mutex>

namespace takoa::storage {

// Ephemeral repository: contents are lost when the process exits.
class InMemoryPersonRepository final : public IPersonRepository {
 public:
  void upsert(const domain::PersonRecord& record) override;
  [[nodiscard]] std::optional<domain::PersonRecord> get(
      const core::PersonId& id) const override;
  [[nodiscard]] std::vector<domain::PersonRecord> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::map<core::PersonId, domain::PersonRecord> records_;
};

}  // namespace takoa::storage
