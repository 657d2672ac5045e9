#pragma once

#include "takoa/storage/redis/redis_config.h"
#include "takoa/storage/repositories.h"

#include <memory>
#include <string>

namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace takoa::storage::redis {

// RedisPersonRepository keeps each PersonRecord as one JSON string.
//
// Keys:
// - takoa:person:<id>  person_to_json(record).dump()
// - takoa:persons      set of every stored id
//
// upsert writes both keys in one MULTI/EXEC transaction.
class RedisPersonRepository final : public IPersonRepository {
 public:
  // Throws std::runtime_error when the server cannot be reached.
  explicit RedisPersonRepository(const RedisConfig& config);
  ~RedisPersonRepository() override;

  RedisPersonRepository(const RedisPersonRepository&) = delete;
  RedisPersonRepository& operator=(const RedisPersonRepository&) = delete;
  RedisPersonRepository(RedisPersonRepository&&) = delete;
  RedisPersonRepository& operator=(RedisPersonRepository&&) = delete;

  void upsert(const domain::PersonRecord& record) override;
  [[nodiscard]] std::optional<domain::PersonRecord> get(
      const core::PersonId& id) const override;
  [[nodiscard]] std::vector<domain::PersonRecord> list_all() const override;

 private:
  std::unique_ptr<sw::redis::Redis> redis_;
};

[[nodiscard]] std::string person_key(const core::PersonId& id);
inline constexpr const char* kPersonIndexKey = "takoa:persons";

}  // namespace takoa::storage::redis
