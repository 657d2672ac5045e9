#include "takoa/engine/profile_store.h"

#include "takoa/core/normalization.h"
#include "takoa/profile/fusion.h"
#include "takoa/profile/semantic_memory.h"

#include <algorithm>
#include <cmath>

namespace takoa::engine {

namespace {

profile::FusionWeights fusion_weights(const domain::EngineConfig& config) {
  return profile::FusionWeights{config.trait_weight, config.semantic_weight};
}

bool needs_recompute(const domain::PersonRecord& record, const std::size_t profile_dim) {
  return record.profile_vector.size() != profile_dim || vector::is_zero(record.profile_vector);
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// StoreSnapshot
// ────────────────────────────────────────────────────────────────

StoreSnapshot::StoreSnapshot(std::vector<domain::PersonRecord> records)
    : records_(std::move(records)) {
  std::sort(records_.begin(), records_.end(),
            [](const domain::PersonRecord& a, const domain::PersonRecord& b) { return a.id < b.id; });
}

const domain::PersonRecord* StoreSnapshot::find(const core::PersonId& id) const {
  const auto it = std::lower_bound(
      records_.begin(), records_.end(), id,
      [](const domain::PersonRecord& r, const core::PersonId& key) { return r.id < key; });
  if (it == records_.end() || it->id != id) {
    return nullptr;
  }
  return &*it;
}

std::vector<vector::Vector> StoreSnapshot::vectors() const {
  std::vector<vector::Vector> out;
  out.reserve(records_.size());
  for (const auto& r : records_) {
    out.push_back(r.profile_vector);
  }
  return out;
}

// ────────────────────────────────────────────────────────────────
// ProfileStore
// ────────────────────────────────────────────────────────────────

ProfileStore::ProfileStore(const domain::EngineConfig& config,
                           const domain::SignalWeightTable& signal_table,
                           embedding::EmbeddingSource& embeddings)
    : config_(config), signal_table_(signal_table), embeddings_(embeddings) {}

void ProfileStore::recompute_vector(domain::PersonRecord& record, bool& used_fallback) {
  if (record.semantic_memory.has_value() &&
      record.semantic_memory->size() != config_.semantic_dim) {
    record.semantic_memory.reset();
  }
  if (!record.semantic_memory.has_value()) {
    auto seeded = profile::seed_from_interests(record.interests, embeddings_);
    used_fallback = used_fallback || seeded.used_fallback;
    record.semantic_memory = std::move(seeded.memory);
  }
  record.profile_vector =
      profile::fuse(record.traits, record.semantic_memory.value(), fusion_weights(config_));
}

InitReport ProfileStore::init(std::vector<domain::PersonRecord> records) {
  InitReport report;
  std::map<std::string, domain::PersonRecord> fresh;

  // Embedding calls happen before the map lock is taken.
  for (auto& record : records) {
    record.interests = core::normalize_interest_tags(record.interests);
    record.confidence = domain::clamp_unit(record.confidence);
    if (needs_recompute(record, config_.profile_dim())) {
      recompute_vector(record, report.used_embedding_fallback);
      report.recomputed.push_back(record.id);
    }
    fresh[record.id.value] = std::move(record);
  }
  report.loaded = fresh.size();

  std::unique_lock<std::shared_mutex> lock(records_mutex_);
  records_ = std::move(fresh);
  return report;
}

std::shared_ptr<std::mutex> ProfileStore::person_lock(const std::string& id) {
  std::lock_guard<std::mutex> lock(locks_mutex_);
  auto& slot = person_locks_[id];
  if (!slot) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

core::Result<OnboardOutcome, core::EngineError> ProfileStore::onboard(
    const OnboardingInput& input) {
  using R = core::Result<OnboardOutcome, core::EngineError>;

  if (input.id.value.empty()) {
    return R::err(core::validation_error("person id must not be empty"));
  }
  if (!std::isfinite(input.confidence) || input.confidence < 0.0 || input.confidence > 1.0) {
    return R::err(core::validation_error("confidence must be in [0,1]"));
  }

  const auto guard = person_lock(input.id.value);
  std::lock_guard<std::mutex> person_guard(*guard);

  if (get(input.id).has_value()) {
    return R::err(core::validation_error("person already exists: " + input.id.value));
  }

  domain::PersonRecord record;
  record.id = input.id;
  record.display_name = input.display_name;
  record.age = input.age;
  record.institution = input.institution;
  record.traits = input.traits.value_or(domain::TraitProfile{});
  record.interests = core::normalize_interest_tags(input.interests);
  record.confidence = input.confidence;

  OnboardOutcome outcome;
  recompute_vector(record, outcome.used_embedding_fallback);

  {
    std::unique_lock<std::shared_mutex> lock(records_mutex_);
    records_[record.id.value] = record;
  }

  outcome.record = std::move(record);
  return R::ok(std::move(outcome));
}

core::Result<TurnOutcome, core::EngineError> ProfileStore::apply_turn(const TurnInput& input) {
  using R = core::Result<TurnOutcome, core::EngineError>;

  if (input.id.value.empty()) {
    return R::err(core::validation_error("person id must not be empty"));
  }

  const auto guard = person_lock(input.id.value);
  std::lock_guard<std::mutex> person_guard(*guard);

  TurnOutcome outcome;
  auto existing = get(input.id);
  outcome.created = !existing.has_value();
  domain::PersonRecord record = existing.value_or(domain::PersonRecord{});
  record.id = input.id;

  auto traits = profile::apply_signals(record.traits, input.signals, input.confidence,
                                       signal_table_, config_.trait_step);
  if (!traits.has_value()) {
    return R::err(traits.error());
  }
  outcome.previous_traits = record.traits;
  record.traits = traits.value();

  std::optional<std::string_view> message;
  if (input.message.has_value()) {
    message = std::string_view(input.message.value());
  }
  auto semantic = profile::update_semantic(record.semantic_memory, record.interests, message,
                                           embeddings_, config_.semantic_blend);
  outcome.used_embedding_fallback = semantic.used_fallback;
  record.semantic_memory = std::move(semantic.memory);

  const vector::Vector candidate =
      profile::fuse(record.traits, record.semantic_memory.value(), fusion_weights(config_));

  if (record.profile_vector.size() != candidate.size() || vector::is_zero(record.profile_vector)) {
    record.profile_vector = candidate;
    outcome.adopted_candidate = true;
  } else {
    auto blended =
        vector::blend(record.profile_vector, candidate, input.confidence * config_.vector_blend);
    if (!blended.has_value()) {
      return R::err(blended.error());
    }
    record.profile_vector = std::move(blended.value());
  }

  if (outcome.created) {
    record.confidence = input.confidence;
  } else {
    record.confidence =
        std::min(1.0, record.confidence + input.confidence * config_.confidence_gain);
  }

  {
    std::unique_lock<std::shared_mutex> lock(records_mutex_);
    records_[record.id.value] = record;
  }

  outcome.record = std::move(record);
  return R::ok(std::move(outcome));
}

std::optional<domain::PersonRecord> ProfileStore::get(const core::PersonId& id) const {
  std::shared_lock<std::shared_mutex> lock(records_mutex_);
  const auto it = records_.find(id.value);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

StoreSnapshot ProfileStore::snapshot() const {
  return StoreSnapshot(export_records());
}

std::vector<domain::PersonRecord> ProfileStore::export_records() const {
  std::shared_lock<std::shared_mutex> lock(records_mutex_);
  std::vector<domain::PersonRecord> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    out.push_back(record);
  }
  return out;
}

std::size_t ProfileStore::size() const {
  std::shared_lock<std::shared_mutex> lock(records_mutex_);
  return records_.size();
}

}  // namespace takoa::engine
