#include "engine_runtime.h"

#include "takoa/app/engine_service.h"
#include "takoa/storage/inmemory_person_repository.h"
#include "takoa/storage/redis/redis_config.h"
#include "takoa/storage/redis/redis_person_repository.h"
#include "takoa/storage/sqlite/sqlite_audit_log.h"
#include "takoa/storage/sqlite/sqlite_person_repository.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace takoa::cli {

namespace {

core::Result<std::string, std::string> read_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<std::string, std::string>::err("cannot read " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return core::Result<std::string, std::string>::ok(buffer.str());
}

core::Result<domain::EngineConfig, std::string> load_engine_config(const CliConfig& config) {
  using R = core::Result<domain::EngineConfig, std::string>;

  domain::EngineConfig engine_config;
  if (config.config_path.has_value()) {
    auto text = read_file(config.config_path.value());
    if (!text.has_value()) {
      return R::err(text.error());
    }
    auto parsed = domain::engine_config_from_json(text.value());
    if (!parsed.has_value()) {
      return R::err("invalid --config: " + parsed.error().message);
    }
    engine_config = parsed.value();
  }

  auto valid = domain::validate(engine_config);
  if (!valid.has_value()) {
    return R::err("invalid engine configuration: " + valid.error().message);
  }
  return R::ok(engine_config);
}

core::Result<domain::SignalWeightTable, std::string> load_signal_table(const CliConfig& config) {
  using R = core::Result<domain::SignalWeightTable, std::string>;

  if (!config.signal_table_path.has_value()) {
    return R::ok(domain::SignalWeightTable::defaults());
  }
  auto text = read_file(config.signal_table_path.value());
  if (!text.has_value()) {
    return R::err(text.error());
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text.value());
  } catch (const nlohmann::json::parse_error& e) {
    return R::err("invalid --signal-table: " + std::string(e.what()));
  }
  auto table = domain::SignalWeightTable::from_json(j);
  if (!table.has_value()) {
    return R::err("invalid --signal-table: " + table.error().message);
  }
  return R::ok(std::move(table.value()));
}

}  // namespace

EngineRuntime::EngineRuntime(domain::EngineConfig engine_config,
                             domain::SignalWeightTable signal_table)
    : engine_config_(engine_config),
      signal_table_(std::move(signal_table)),
      fallback_provider_(engine_config.semantic_dim) {}

core::Result<std::unique_ptr<EngineRuntime>, std::string> EngineRuntime::create(
    const CliConfig& config) {
  using R = core::Result<std::unique_ptr<EngineRuntime>, std::string>;

  auto engine_config = load_engine_config(config);
  if (!engine_config.has_value()) {
    return R::err(engine_config.error());
  }
  auto signal_table = load_signal_table(config);
  if (!signal_table.has_value()) {
    return R::err(signal_table.error());
  }

  std::unique_ptr<EngineRuntime> rt(
      new EngineRuntime(engine_config.value(), std::move(signal_table.value())));

  // ── Embeddings ────────────────────────────────────────────────
  if (config.embedding_url.has_value()) {
    embedding::HttpEmbeddingConfig http;
    http.endpoint = config.embedding_url.value();
    if (config.embedding_model.has_value()) {
      http.model = config.embedding_model.value();
    }
    if (const char* key = std::getenv("OPENAI_API_KEY"); key != nullptr) {
      http.api_key = key;
    }
    http.dimension = rt->engine_config_.semantic_dim;
    rt->primary_provider_ = std::make_unique<embedding::HttpEmbeddingProvider>(std::move(http));
  }
  rt->embeddings_ = std::make_unique<embedding::EmbeddingSource>(rt->primary_provider_.get(),
                                                                 rt->fallback_provider_);
  rt->store_ = std::make_unique<engine::ProfileStore>(rt->engine_config_, rt->signal_table_,
                                                      *rt->embeddings_);

  // ── Storage ───────────────────────────────────────────────────
  if (config.db_path.has_value()) {
    auto db = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db.has_value()) {
      return R::err(db.error());
    }
    rt->db_ = db.value();
    auto schema = rt->db_->ensure_schema_v1();
    if (!schema.has_value()) {
      return R::err(schema.error());
    }
    rt->persons_ = std::make_unique<storage::sqlite::SqlitePersonRepository>(rt->db_);
    rt->audit_log_ = std::make_unique<storage::sqlite::SqliteAuditLog>(rt->db_);
    rt->ephemeral_ = false;
    std::cerr << "Persons: SQLite " << config.db_path.value() << "\n";
  } else if (config.redis_uri.has_value()) {
    const auto redis = storage::redis::parse_redis_uri(config.redis_uri.value());
    if (!redis.has_value()) {
      return R::err("invalid Redis URI: " + config.redis_uri.value());
    }
    try {
      rt->persons_ = std::make_unique<storage::redis::RedisPersonRepository>(redis.value());
    } catch (const std::runtime_error& e) {
      return R::err(e.what());
    }
    rt->audit_log_ = std::make_unique<storage::InMemoryAuditLog>();
    rt->ephemeral_ = false;
    std::cerr << "Persons: Redis " << storage::redis::redis_config_to_log_string(redis.value())
              << " (audit events are not persisted)\n";
  } else {
    rt->persons_ = std::make_unique<storage::InMemoryPersonRepository>();
    rt->audit_log_ = std::make_unique<storage::InMemoryAuditLog>();
  }

  rt->services_ = std::make_unique<core::Services>(*rt->persons_, *rt->audit_log_, *rt->store_);

  try {
    const auto report = app::load_store_from_repository(*rt->services_, rt->id_gen_, rt->clock_);
    if (!report.recomputed.empty()) {
      std::cerr << "Recomputed " << report.recomputed.size() << " stored profile vector(s)\n";
    }
  } catch (const std::runtime_error& e) {
    return R::err(std::string("failed to load persons: ") + e.what());
  } catch (const nlohmann::json::exception& e) {
    return R::err(std::string("stored person record is malformed: ") + e.what());
  }

  return R::ok(std::move(rt));
}

}  // namespace takoa::cli
