#pragma once

#include "takoa/core/clock.h"
#include "takoa/core/id_generator.h"
#include "takoa/core/result.h"
#include "takoa/core/services.h"
#include "takoa/engine/profile_store.h"

#include <optional>
#include <string>

namespace takoa::app {

// ────────────────────────────────────────────────────────────────
// Onboarding Pipeline
// ────────────────────────────────────────────────────────────────

struct OnboardingRequest {
  // An empty input.id is replaced by a generated person id.
  engine::OnboardingInput input;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct OnboardingResponse {
  std::string trace_id;                 // NOLINT(readability-identifier-naming)
  domain::PersonRecord record;          // NOLINT(readability-identifier-naming)
  bool used_embedding_fallback{false};  // NOLINT(readability-identifier-naming)
};

// Creates the person in the store and persists the record.
// Emits: OnboardingStarted, then either OnboardingRejected, or
// [EmbeddingFallbackUsed], PersonOnboarded.
[[nodiscard]] core::Result<OnboardingResponse, core::EngineError> run_onboarding_pipeline(
    const OnboardingRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Turn Pipeline
// ────────────────────────────────────────────────────────────────

struct TurnRequest {
  engine::TurnInput input;              // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)
};

struct TurnResponse {
  std::string trace_id;          // NOLINT(readability-identifier-naming)
  engine::TurnOutcome outcome;   // NOLINT(readability-identifier-naming)
};

// Applies one conversational turn and persists the updated record.
// Emits: TurnStarted, then either TurnRejected, or TraitsUpdated,
// [EmbeddingFallbackUsed], ProfileVectorUpdated, TurnCompleted.
//
// A persistence failure propagates as std::runtime_error after the in-memory
// update has been applied.
[[nodiscard]] core::Result<TurnResponse, core::EngineError> run_turn_pipeline(
    const TurnRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Store Initialization
// ────────────────────────────────────────────────────────────────

// Loads every repository record into the store. Records whose ProfileVector had
// to be recomputed are written back. Emits StoreInitialized (and
// EmbeddingFallbackUsed when recomputation could not reach the primary provider).
engine::InitReport load_store_from_repository(core::Services& services,
                                              core::IIdGenerator& id_gen, core::IClock& clock);

}  // namespace takoa::app
