#pragma once

#include "takoa/core/result.h"
#include "takoa/domain/engine_config.h"
#include "takoa/domain/person.h"
#include "takoa/domain/signal_weights.h"
#include "takoa/embedding/embedding_source.h"
#include "takoa/profile/trait_model.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace takoa::engine {

// StoreSnapshot is an immutable copy of every person record, ordered by id.
// All read-side operations (retrieval, explanation, clustering, projection) run
// against a snapshot, so they never observe a half-applied turn and never wait
// on writers or on the embedding provider.
class StoreSnapshot {
 public:
  StoreSnapshot() = default;
  explicit StoreSnapshot(std::vector<domain::PersonRecord> records);

  [[nodiscard]] const std::vector<domain::PersonRecord>& records() const { return records_; }
  [[nodiscard]] const domain::PersonRecord* find(const core::PersonId& id) const;
  [[nodiscard]] std::size_t size() const { return records_.size(); }
  [[nodiscard]] bool empty() const { return records_.empty(); }

  // Bulk read of all current ProfileVectors, in records() order.
  [[nodiscard]] std::vector<vector::Vector> vectors() const;

 private:
  std::vector<domain::PersonRecord> records_;
};

struct OnboardingInput {
  core::PersonId id;                                           // NOLINT(readability-identifier-naming)
  std::string display_name{domain::kDefaultDisplayName};       // NOLINT(readability-identifier-naming)
  int age{domain::kDefaultAge};                                // NOLINT(readability-identifier-naming)
  std::string institution{domain::kDefaultInstitution};        // NOLINT(readability-identifier-naming)
  std::vector<std::string> interests;                          // NOLINT(readability-identifier-naming)
  std::optional<domain::TraitProfile> traits;                  // NOLINT(readability-identifier-naming)
  double confidence{domain::kDefaultConfidence};               // NOLINT(readability-identifier-naming)
};

struct OnboardOutcome {
  domain::PersonRecord record;          // NOLINT(readability-identifier-naming)
  bool used_embedding_fallback{false};  // NOLINT(readability-identifier-naming)
};

struct TurnInput {
  core::PersonId id;                   // NOLINT(readability-identifier-naming)
  profile::SignalMap signals;          // NOLINT(readability-identifier-naming)
  double confidence{0.0};              // NOLINT(readability-identifier-naming)
  std::optional<std::string> message;  // NOLINT(readability-identifier-naming)
};

struct TurnOutcome {
  domain::PersonRecord record;           // NOLINT(readability-identifier-naming)
  domain::TraitProfile previous_traits;  // NOLINT(readability-identifier-naming)
  bool created{false};                   // NOLINT(readability-identifier-naming)
  bool adopted_candidate{false};         // NOLINT(readability-identifier-naming)
  bool used_embedding_fallback{false};   // NOLINT(readability-identifier-naming)
};

struct InitReport {
  std::size_t loaded{0};                        // NOLINT(readability-identifier-naming)
  std::vector<core::PersonId> recomputed;       // NOLINT(readability-identifier-naming)
  bool used_embedding_fallback{false};          // NOLINT(readability-identifier-naming)
};

// ProfileStore owns the in-memory map from person id to record.
//
// Lifecycle: init(existing records) -> onboard/apply_turn/snapshot ... -> export_records().
// There is no global instance; callers construct one and pass it by reference.
//
// Concurrency:
// - writes to the same person are serialized by a per-person mutex
// - writes to different people proceed in parallel; the record map is only held
//   exclusively for the final copy-in, after all embedding calls have finished
// - snapshot() takes the map lock shared
class ProfileStore {
 public:
  // config must already be validated. All references must outlive the store.
  ProfileStore(const domain::EngineConfig& config, const domain::SignalWeightTable& signal_table,
               embedding::EmbeddingSource& embeddings);

  ProfileStore(const ProfileStore&) = delete;
  ProfileStore& operator=(const ProfileStore&) = delete;
  ProfileStore(ProfileStore&&) = delete;
  ProfileStore& operator=(ProfileStore&&) = delete;

  // Replaces the store contents. Records whose ProfileVector is empty, all zero or
  // of the wrong length get it recomputed from traits and semantic memory; their ids are
  // listed in the report so callers can write them back.
  InitReport init(std::vector<domain::PersonRecord> records);

  // Creates a person, seeding semantic memory from interests and fusing the first
  // ProfileVector. Re-onboarding an existing id is a validation error.
  [[nodiscard]] core::Result<OnboardOutcome, core::EngineError> onboard(
      const OnboardingInput& input);

  // Applies one conversational turn: trait nudge, semantic memory update, vector
  // blend (factor confidence * vector_blend) and confidence growth. An unknown id
  // is first contact: the person is created with onboarding defaults.
  [[nodiscard]] core::Result<TurnOutcome, core::EngineError> apply_turn(const TurnInput& input);

  [[nodiscard]] std::optional<domain::PersonRecord> get(const core::PersonId& id) const;
  [[nodiscard]] StoreSnapshot snapshot() const;
  [[nodiscard]] std::vector<domain::PersonRecord> export_records() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const domain::EngineConfig& config() const { return config_; }

 private:
  std::shared_ptr<std::mutex> person_lock(const std::string& id);
  void recompute_vector(domain::PersonRecord& record, bool& used_fallback);

  const domain::EngineConfig& config_;
  const domain::SignalWeightTable& signal_table_;
  embedding::EmbeddingSource& embeddings_;

  mutable std::shared_mutex records_mutex_;
  std::map<std::string, domain::PersonRecord> records_;

  std::mutex locks_mutex_;
  std::map<std::string, std::shared_ptr<std::mutex>> person_locks_;
};

}  // namespace takoa::engine
