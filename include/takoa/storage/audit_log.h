#pragma once

#include "takoa/storage/audit_event.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace takoa::storage {

// Append-only record of engine activity, chained per trace.
// Implementations must be safe to call from concurrent turns.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Empty trace_id returns every event in append order.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
  // Last event_hash per trace; keys are exactly the traces seen so far.
  std::map<std::string, std::string> chain_heads_;
};

}  // namespace takoa::storage
