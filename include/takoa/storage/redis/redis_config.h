#pragma once

#include <optional>
#include <string>

namespace takoa::storage::redis {

inline constexpr int kDefaultRedisPort = 6379;

// A parsed Redis location.
//
// Accepted forms:
//   tcp://host[:port]
//   redis://host[:port][/N]   N selects the logical database
struct RedisConfig {
  std::string uri;                 // NOLINT(readability-identifier-naming)
  std::string host;                // NOLINT(readability-identifier-naming)
  int port{kDefaultRedisPort};     // NOLINT(readability-identifier-naming)
  int db{0};                       // NOLINT(readability-identifier-naming)
};

// nullopt for an empty string, an unknown scheme, a missing host, a port
// outside 1..65535 or a non-numeric database index. Pure string parsing.
[[nodiscard]] std::optional<RedisConfig> parse_redis_uri(const std::string& uri);

// "host:port/db" for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace takoa::storage::redis
