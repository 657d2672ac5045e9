#pragma once

#include "cli_config.h"

#include "takoa/core/clock.h"
#include "takoa/core/id_generator.h"
#include "takoa/core/result.h"
#include "takoa/core/services.h"
#include "takoa/domain/engine_config.h"
#include "takoa/domain/signal_weights.h"
#include "takoa/embedding/embedding_provider.h"
#include "takoa/embedding/embedding_source.h"
#include "takoa/embedding/http_embedding_provider.h"
#include "takoa/engine/profile_store.h"
#include "takoa/storage/audit_log.h"
#include "takoa/storage/repositories.h"
#include "takoa/storage/sqlite/sqlite_db.h"

#include <memory>
#include <string>

namespace takoa::cli {

// EngineRuntime is the CLI's composition root: it owns every concrete
// collaborator and hands out the Services view the pipelines work on.
// Members are declared in dependency order so destruction runs in reverse.
class EngineRuntime {
 public:
  // Opens storage, builds the engine and loads the stored persons into it.
  // Errors are messages ready for stderr.
  [[nodiscard]] static core::Result<std::unique_ptr<EngineRuntime>, std::string> create(
      const CliConfig& config);

  EngineRuntime(const EngineRuntime&) = delete;
  EngineRuntime& operator=(const EngineRuntime&) = delete;
  EngineRuntime(EngineRuntime&&) = delete;
  EngineRuntime& operator=(EngineRuntime&&) = delete;
  ~EngineRuntime() = default;

  [[nodiscard]] core::Services& services() { return *services_; }
  [[nodiscard]] core::IIdGenerator& id_gen() { return id_gen_; }
  [[nodiscard]] core::IClock& clock() { return clock_; }
  [[nodiscard]] const domain::EngineConfig& engine_config() const { return engine_config_; }
  [[nodiscard]] const embedding::EmbeddingSource& embeddings() const { return *embeddings_; }

  // True when nothing written by this run survives the process.
  [[nodiscard]] bool ephemeral() const { return ephemeral_; }

 private:
  EngineRuntime(domain::EngineConfig engine_config, domain::SignalWeightTable signal_table);

  domain::EngineConfig engine_config_;
  domain::SignalWeightTable signal_table_;

  embedding::HashEmbeddingProvider fallback_provider_;
  std::unique_ptr<embedding::HttpEmbeddingProvider> primary_provider_;
  std::unique_ptr<embedding::EmbeddingSource> embeddings_;
  std::unique_ptr<engine::ProfileStore> store_;

  std::shared_ptr<storage::sqlite::SqliteDb> db_;
  std::unique_ptr<storage::IPersonRepository> persons_;
  std::unique_ptr<storage::IAuditLog> audit_log_;
  std::unique_ptr<core::Services> services_;

  core::SystemIdGenerator id_gen_;
  core::SystemClock clock_;
  bool ephemeral_{true};
};

}  // namespace takoa::cli
