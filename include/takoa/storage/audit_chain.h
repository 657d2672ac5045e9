#pragma once

#include "takoa/storage/audit_event.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace takoa::storage {

// previous_hash of the first event in every trace.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// SHA-256 (lowercase hex) over the event's sorted-key JSON, hash fields
// excluded, followed by previous_hash. Pure.
[[nodiscard]] std::string compute_event_hash(const AuditEvent& event,
                                             const std::string& previous_hash);

struct ChainCheck {
  bool valid{false};                  // NOLINT(readability-identifier-naming)
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;                  // NOLINT(readability-identifier-naming)
};

// Checks one trace's events, in append order. On success first_invalid_index
// equals events.size().
[[nodiscard]] ChainCheck verify_audit_chain(const std::vector<AuditEvent>& events);

}  // namespace takoa::storage
