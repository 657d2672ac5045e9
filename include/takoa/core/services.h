#pragma once

#include "takoa/engine/profile_store.h"
#include "takoa/storage/audit_log.h"
#include "takoa/storage/repositories.h"

namespace takoa::core {

// Services bundles the collaborators every pipeline needs. It holds references
// only; the entry point owns the concrete instances and their lifetimes.
struct Services {
  storage::IPersonRepository& persons;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;        // NOLINT(readability-identifier-naming)
  engine::ProfileStore& store;          // NOLINT(readability-identifier-naming)

  Services(storage::IPersonRepository& persons, storage::IAuditLog& audit_log,
           engine::ProfileStore& store)
      : persons(persons), audit_log(audit_log), store(store) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace takoa::core
