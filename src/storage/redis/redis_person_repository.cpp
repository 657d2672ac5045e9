#include "takoa/storage/redis/redis_person_repository.h"

#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace takoa::storage::redis {

std::string person_key(const core::PersonId& id) {
  return "takoa:person:" + id.value;
}

RedisPersonRepository::RedisPersonRepository(const RedisConfig& config) {
  sw::redis::ConnectionOptions options;
  options.host = config.host;
  options.port = config.port;
  options.db = config.db;
  try {
    redis_ = std::make_unique<sw::redis::Redis>(options);
    redis_->ping();
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to connect to Redis: " + std::string(e.what()));
  }
}

RedisPersonRepository::~RedisPersonRepository() = default;

void RedisPersonRepository::upsert(const domain::PersonRecord& record) {
  try {
    auto tx = redis_->transaction();
    tx.set(person_key(record.id), domain::person_to_json(record).dump())
        .sadd(kPersonIndexKey, record.id.value)
        .exec();
  } catch (const sw::redis::Error& e) {
    throw std::runtime_error("Redis upsert failed for " + record.id.value + ": " + e.what());
  }
}

std::optional<domain::PersonRecord> RedisPersonRepository::get(const core::PersonId& id) const {
  sw::redis::OptionalString raw;
  try {
    raw = redis_->get(person_key(id));
  } catch (const sw::redis::Error& e) {
    throw std::runtime_error("Redis get failed for " + id.value + ": " + e.what());
  }
  if (!raw) {
    return std::nullopt;
  }
  return domain::person_from_json(nlohmann::json::parse(*raw));
}

std::vector<domain::PersonRecord> RedisPersonRepository::list_all() const {
  std::vector<std::string> ids;
  std::vector<sw::redis::OptionalString> values;
  try {
    redis_->smembers(kPersonIndexKey, std::back_inserter(ids));
    std::sort(ids.begin(), ids.end());
    if (ids.empty()) {
      return {};
    }

    std::vector<std::string> keys;
    keys.reserve(ids.size());
    for (const auto& id : ids) {
      keys.push_back(person_key(core::PersonId{id}));
    }
    redis_->mget(keys.begin(), keys.end(), std::back_inserter(values));
  } catch (const sw::redis::Error& e) {
    throw std::runtime_error("Redis scan of " + std::string(kPersonIndexKey) +
                             " failed: " + e.what());
  }

  std::vector<domain::PersonRecord> out;
  out.reserve(values.size());
  for (const auto& value : values) {
    // An id left in the set after its key expired or was deleted by hand.
    if (value) {
      out.push_back(domain::person_from_json(nlohmann::json::parse(*value)));
    }
  }
  return out;
}

}  // namespace takoa::storage::redis
