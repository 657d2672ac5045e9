#include "takoa/storage/audit_chain.h"

#include "takoa/core/sha256.h"

#include <nlohmann/json.hpp>

namespace takoa::storage {

std::string compute_event_hash(const AuditEvent& event, const std::string& previous_hash) {
  // nlohmann::json objects are std::map backed, so dump() emits keys sorted.
  const nlohmann::json body = {
      {"created_at", event.created_at}, {"event_id", event.event_id},
      {"event_type", event.event_type}, {"payload", event.payload},
      {"refs", event.refs},             {"trace_id", event.trace_id},
  };
  return core::sha256_hex(body.dump() + previous_hash);
}

ChainCheck verify_audit_chain(const std::vector<AuditEvent>& events) {
  std::string expected = std::string(kGenesisHash);

  for (std::size_t i = 0; i < events.size(); ++i) {
    const AuditEvent& ev = events[i];
    if (ev.previous_hash != expected) {
      return {false, i, "previous_hash does not link at index " + std::to_string(i)};
    }
    if (ev.event_hash != compute_event_hash(ev, ev.previous_hash)) {
      return {false, i, "event_hash does not match contents at index " + std::to_string(i)};
    }
    expected = ev.event_hash;
  }

  return {true, events.size(), ""};
}

}  // namespace takoa::storage
