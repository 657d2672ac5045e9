#include "takoa/storage/audit_chain.h"
#include "takoa/storage/sqlite/sqlite_audit_log.h"
#include "takoa/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <stdexcept>

using namespace takoa;
using storage::sqlite::SqliteAuditLog;
using storage::sqlite::SqliteDb;

TEST_CASE("SqliteAuditLog append and query", "[sqlite][audit]") {
  auto db_result = SqliteDb::open(":memory:");
  REQUIRE(db_result.has_value());
  auto db = db_result.value();
  REQUIRE(db->ensure_schema_v1().has_value());

  SqliteAuditLog audit_log(db);

  const std::string trace_id = "trace-001";
  audit_log.append(
      {"evt-001", trace_id, "TurnStarted", R"({"person_id":"alice"})", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-002",
                    trace_id,
                    "TraitsUpdated",
                    R"({"created":false})",
                    "2026-01-01T00:00:01Z",
                    {"alice"}});
  audit_log.append(
      {"evt-003", trace_id, "TurnCompleted", R"({"status":"ok"})", "2026-01-01T00:00:02Z", {}});

  const auto events = audit_log.query(trace_id);
  REQUIRE(events.size() == 3);

  // Deterministic ordering by idx
  CHECK(events[0].event_id == "evt-001");
  CHECK(events[1].event_id == "evt-002");
  CHECK(events[2].event_id == "evt-003");

  CHECK(events[0].refs.empty());
  REQUIRE(events[1].refs.size() == 1);
  CHECK(events[1].refs[0] == "alice");

  CHECK(events[0].previous_hash == storage::kGenesisHash);
  CHECK(storage::verify_audit_chain(events).valid);
}

TEST_CASE("SqliteAuditLog multiple traces", "[sqlite][audit]") {
  auto db = SqliteDb::open(":memory:").value();
  REQUIRE(db->ensure_schema_v1().has_value());
  SqliteAuditLog audit_log(db);

  audit_log.append({"evt-1a", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-1b", "trace-B", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  audit_log.append({"evt-2a", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events_a = audit_log.query("trace-A");
  REQUIRE(events_a.size() == 2);
  CHECK(events_a[0].event_id == "evt-1a");
  CHECK(events_a[1].event_id == "evt-2a");

  const auto events_b = audit_log.query("trace-B");
  REQUIRE(events_b.size() == 1);
  CHECK(events_b[0].previous_hash == storage::kGenesisHash);

  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"trace-A", "trace-B"});
}

TEST_CASE("SqliteAuditLog duplicate event id throws and keeps the chain intact",
          "[sqlite][audit]") {
  auto db = SqliteDb::open(":memory:").value();
  REQUIRE(db->ensure_schema_v1().has_value());
  SqliteAuditLog audit_log(db);

  audit_log.append({"evt-1", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
  CHECK_THROWS_AS(
      audit_log.append({"evt-1", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}}),
      std::runtime_error);
  audit_log.append({"evt-2", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}});

  const auto events = audit_log.query("trace-A");
  REQUIRE(events.size() == 2);
  CHECK(storage::verify_audit_chain(events).valid);
}

TEST_CASE("SqliteAuditLog resumes a chain after reopening", "[sqlite][audit]") {
  const auto path = std::filesystem::temp_directory_path() / "takoa_audit_resume_test.db";
  std::filesystem::remove(path);

  {
    auto db = SqliteDb::open(path.string()).value();
    REQUIRE(db->ensure_schema_v1().has_value());
    SqliteAuditLog audit_log(db);
    audit_log.append({"evt-1", "trace-A", "Event1", "{}", "2026-01-01T00:00:00Z", {}});
    audit_log.append({"evt-2", "trace-A", "Event2", "{}", "2026-01-01T00:00:01Z", {}});
  }
  {
    auto db = SqliteDb::open(path.string()).value();
    REQUIRE(db->ensure_schema_v1().has_value());
    SqliteAuditLog audit_log(db);
    audit_log.append({"evt-3", "trace-A", "Event3", "{}", "2026-01-01T00:00:02Z", {}});

    const auto events = audit_log.query("trace-A");
    REQUIRE(events.size() == 3);
    CHECK(events[2].previous_hash == events[1].event_hash);
    CHECK(storage::verify_audit_chain(events).valid);
  }

  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}
