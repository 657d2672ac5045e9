#include "cli_config.h"

#include <cmath>
#include <stdexcept>

namespace takoa::cli {

namespace {

std::optional<double> parse_double(const std::string& text) {
  try {
    std::size_t used = 0;
    const double v = std::stod(text, &used);
    if (used != text.size() || !std::isfinite(v)) {
      return std::nullopt;
    }
    return v;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<long long> parse_integer(const std::string& text) {
  try {
    std::size_t used = 0;
    const long long v = std::stoll(text, &used);
    if (used != text.size()) {
      return std::nullopt;
    }
    return v;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

bool store_named(std::map<std::string, double>& into, const std::string& value) {
  auto parsed = parse_named_number(value);
  if (!parsed.has_value()) {
    return false;
  }
  into[parsed->first] = parsed->second;
  return true;
}

}  // namespace

std::optional<std::pair<std::string, double>> parse_named_number(const std::string& text) {
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    return std::nullopt;
  }
  const auto number = parse_double(text.substr(eq + 1));
  if (!number.has_value()) {
    return std::nullopt;
  }
  return std::make_pair(text.substr(0, eq), number.value());
}

const std::vector<apps::Option<CliConfig>>& cli_options() {
  static const std::vector<apps::Option<CliConfig>> options = {
      {"--db", true, "SQLite database file for persons and audit events",
       [](CliConfig& c, const std::string& v) {
         c.db_path = v;
         return !v.empty();
       }},
      {"--redis", true, "Redis URI for person storage (tcp://host:port, redis://host:port/N)",
       [](CliConfig& c, const std::string& v) {
         c.redis_uri = v;
         return !v.empty();
       }},
      {"--config", true, "EngineConfig JSON file",
       [](CliConfig& c, const std::string& v) {
         c.config_path = v;
         return !v.empty();
       }},
      {"--signal-table", true, "signal-to-trait weight table JSON file",
       [](CliConfig& c, const std::string& v) {
         c.signal_table_path = v;
         return !v.empty();
       }},
      {"--embedding-url", true, "OpenAI-compatible embeddings endpoint (key from OPENAI_API_KEY)",
       [](CliConfig& c, const std::string& v) {
         c.embedding_url = v;
         return !v.empty();
       }},
      {"--embedding-model", true, "embedding model name",
       [](CliConfig& c, const std::string& v) {
         c.embedding_model = v;
         return !v.empty();
       }},
      {"--id", true, "person id",
       [](CliConfig& c, const std::string& v) {
         c.id = v;
         return !v.empty();
       }},
      {"--other", true, "second person id (explain)",
       [](CliConfig& c, const std::string& v) {
         c.other_id = v;
         return !v.empty();
       }},
      {"--member", true, "group member id (cohesion, repeatable)",
       [](CliConfig& c, const std::string& v) {
         c.members.push_back(v);
         return !v.empty();
       }},
      {"--name", true, "display name (onboard)",
       [](CliConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
      {"--age", true, "age (onboard)",
       [](CliConfig& c, const std::string& v) {
         const auto age = parse_integer(v);
         if (!age.has_value() || *age < 0 || *age > 150) {
           return false;
         }
         c.age = static_cast<int>(*age);
         return true;
       }},
      {"--uni", true, "institution (onboard)",
       [](CliConfig& c, const std::string& v) {
         c.institution = v;
         return true;
       }},
      {"--interest", true, "interest tag (onboard, repeatable)",
       [](CliConfig& c, const std::string& v) {
         c.interests.push_back(v);
         return true;
       }},
      {"--trait", true, "initial trait as name=value (onboard, repeatable)",
       [](CliConfig& c, const std::string& v) { return store_named(c.traits, v); }},
      {"--signal", true, "signal as name=magnitude (turn, repeatable)",
       [](CliConfig& c, const std::string& v) { return store_named(c.signals, v); }},
      {"--confidence", true, "extraction confidence in [0,1]",
       [](CliConfig& c, const std::string& v) {
         c.confidence = parse_double(v);
         return c.confidence.has_value();
       }},
      {"--message", true, "conversation message text (turn)",
       [](CliConfig& c, const std::string& v) {
         c.message = v;
         return true;
       }},
      {"--k", true, "neighbour count (neighbors, graph)",
       [](CliConfig& c, const std::string& v) {
         const auto k = parse_integer(v);
         if (!k.has_value() || *k < 1) {
           return false;
         }
         c.k = static_cast<std::size_t>(*k);
         return true;
       }},
      {"--mode", true, "graph layout: force or embedding",
       [](CliConfig& c, const std::string& v) {
         c.graph_mode = v;
         return true;
       }},
      {"--trace", true, "trace id to record events under",
       [](CliConfig& c, const std::string& v) {
         c.trace_id = v;
         return !v.empty();
       }},
  };
  return options;
}

}  // namespace takoa::cli
