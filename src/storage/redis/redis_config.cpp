#include "takoa/storage/redis/redis_config.h"

#include <charconv>
#include <string_view>

namespace takoa::storage::redis {

namespace {

std::optional<int> parse_decimal(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<RedisConfig> parse_redis_uri(const std::string& uri) {
  std::string_view rest{uri};
  bool allow_db = false;

  if (rest.starts_with("tcp://")) {
    rest.remove_prefix(6);
  } else if (rest.starts_with("redis://")) {
    rest.remove_prefix(8);
    allow_db = true;
  } else {
    return std::nullopt;
  }

  RedisConfig config;
  config.uri = uri;

  const auto slash = rest.find('/');
  if (slash != std::string_view::npos) {
    if (!allow_db) {
      return std::nullopt;
    }
    const auto db = parse_decimal(rest.substr(slash + 1));
    if (!db.has_value() || *db < 0) {
      return std::nullopt;
    }
    config.db = *db;
    rest = rest.substr(0, slash);
  }

  const auto colon = rest.rfind(':');
  if (colon != std::string_view::npos) {
    const auto port = parse_decimal(rest.substr(colon + 1));
    if (!port.has_value() || *port < 1 || *port > 65535) {
      return std::nullopt;
    }
    config.port = *port;
    rest = rest.substr(0, colon);
  }

  if (rest.empty()) {
    return std::nullopt;
  }
  config.host = std::string{rest};
  return config;
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  return config.host + ":" + std::to_string(config.port) + "/" + std::to_string(config.db);
}

}  // namespace takoa::storage::redis
