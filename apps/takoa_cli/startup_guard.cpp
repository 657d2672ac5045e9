#include "startup_guard.h"

#include "takoa/app/social_graph.h"
#include "takoa/storage/redis/redis_config.h"

#include <set>

namespace takoa::cli {

std::string validate_cli_config(const std::string& command, const CliConfig& config) {
  if (config.db_path.has_value() && config.redis_uri.has_value()) {
    return "Error: --db and --redis cannot be combined.\n"
           "       Choose one durable store for person records.";
  }

  if (config.redis_uri.has_value() &&
      !storage::redis::parse_redis_uri(config.redis_uri.value()).has_value()) {
    return "Error: --redis URI '" + config.redis_uri.value() +
           "' is not a valid Redis URI.\n"
           "       Accepted formats: tcp://host[:port], redis://host[:port][/N]";
  }

  if (config.embedding_model.has_value() && !config.embedding_url.has_value()) {
    return "Error: --embedding-model requires --embedding-url.";
  }

  if (command == "turn") {
    if (!config.id.has_value()) {
      return "Error: turn requires --id <person>.";
    }
    if (!config.confidence.has_value()) {
      return "Error: turn requires --confidence <0..1>.";
    }
  } else if (command == "neighbors") {
    if (!config.id.has_value()) {
      return "Error: neighbors requires --id <person>.";
    }
  } else if (command == "explain") {
    if (!config.id.has_value() || !config.other_id.has_value()) {
      return "Error: explain requires --id <person> and --other <person>.";
    }
  } else if (command == "cohesion") {
    const std::set<std::string> distinct(config.members.begin(), config.members.end());
    if (distinct.size() < 2) {
      return "Error: cohesion requires at least two distinct --member ids.";
    }
  } else if (command == "graph") {
    if (!app::graph_mode_from_string(config.graph_mode).has_value()) {
      return "Error: --mode must be 'force' or 'embedding', got '" + config.graph_mode + "'.";
    }
  }

  return "";
}

}  // namespace takoa::cli
