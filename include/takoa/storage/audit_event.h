#pragma once

#include <string>
#include <vector>

namespace takoa::storage {

// One engine decision worth keeping: an onboarding, a turn, a fallback taken.
// payload is a JSON object serialized to text; refs lists the person ids involved.
struct AuditEvent {
  std::string event_id;            // NOLINT(readability-identifier-naming)
  std::string trace_id;            // NOLINT(readability-identifier-naming)
  std::string event_type;          // NOLINT(readability-identifier-naming)
  std::string payload;             // NOLINT(readability-identifier-naming)
  std::string created_at;          // NOLINT(readability-identifier-naming)
  std::vector<std::string> refs;   // NOLINT(readability-identifier-naming)
  // Filled in by the log on append.
  std::string previous_hash{};  // NOLINT(readability-identifier-naming)
  std::string event_hash{};     // NOLINT(readability-identifier-naming)
};

}  // namespace takoa::storage
