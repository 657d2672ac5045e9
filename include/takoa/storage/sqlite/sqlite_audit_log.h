#pragma once

#include "takoa/storage/audit_log.h"
#include "takoa/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace takoa::storage::sqlite {

// SqliteAuditLog persists the per-trace hash chain in audit_events.
// Order within a trace is the idx column. Chains survive restarts: the first
// append to a trace after opening resumes from the stored head.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  // Throws std::runtime_error when the row cannot be written.
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  struct ChainHead {
    int next_idx{0};            // NOLINT(readability-identifier-naming)
    std::string last_hash{};    // NOLINT(readability-identifier-naming)
  };

  // Loads the head from the database the first time a trace is seen.
  ChainHead& head_for(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;

  // Guards heads_ and serializes appends so idx and previous_hash stay consistent.
  std::mutex mutex_;
  std::map<std::string, ChainHead> heads_;
};

}  // namespace takoa::storage::sqlite
