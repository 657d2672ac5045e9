#include "takoa/storage/audit_log.h"

#include "takoa/storage/audit_chain.h"

namespace takoa::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto [head, inserted] = chain_heads_.try_emplace(event.trace_id, std::string(kGenesisHash));
  AuditEvent stored = event;
  stored.previous_hash = head->second;
  stored.event_hash = compute_event_hash(event, stored.previous_hash);

  head->second = stored.event_hash;
  events_.push_back(std::move(stored));
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> out;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      out.push_back(event);
    }
  }
  return out;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(chain_heads_.size());
  for (const auto& [trace, _] : chain_heads_) {
    ids.push_back(trace);
  }
  return ids;
}

}  // namespace takoa::storage
