#include "takoa/storage/inmemory_person_repository.h"

namespace takoa::storage {

void InMemoryPersonRepository::upsert(const domain::PersonRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[record.id] = record;
}

std::optional<domain::PersonRecord> InMemoryPersonRepository::get(
    const core::PersonId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::PersonRecord> InMemoryPersonRepository::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<domain::PersonRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

}  // namespace takoa::storage
