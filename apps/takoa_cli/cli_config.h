#pragma once

#include "shared/arg_parser.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace takoa::cli {

// Settings for one takoa_cli invocation. Storage and engine flags are shared by
// every command; the rest are read only by the commands that need them.
struct CliConfig {
  // ── Storage ───────────────────────────────────────────────────
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)

  // ── Engine ────────────────────────────────────────────────────
  std::optional<std::string> config_path;        // NOLINT(readability-identifier-naming)
  std::optional<std::string> signal_table_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> embedding_url;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> embedding_model;    // NOLINT(readability-identifier-naming)

  // ── Command arguments ─────────────────────────────────────────
  std::optional<std::string> id;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> other_id;          // NOLINT(readability-identifier-naming)
  std::vector<std::string> members;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> name;              // NOLINT(readability-identifier-naming)
  std::optional<int> age;                       // NOLINT(readability-identifier-naming)
  std::optional<std::string> institution;       // NOLINT(readability-identifier-naming)
  std::vector<std::string> interests;           // NOLINT(readability-identifier-naming)
  std::map<std::string, double> traits;         // NOLINT(readability-identifier-naming)
  std::map<std::string, double> signals;        // NOLINT(readability-identifier-naming)
  std::optional<double> confidence;             // NOLINT(readability-identifier-naming)
  std::optional<std::string> message;           // NOLINT(readability-identifier-naming)
  std::size_t k{5};                             // NOLINT(readability-identifier-naming)
  std::string graph_mode{"force"};              // NOLINT(readability-identifier-naming)
  std::optional<std::string> trace_id;          // NOLINT(readability-identifier-naming)
};

[[nodiscard]] const std::vector<apps::Option<CliConfig>>& cli_options();

// Splits "name=value" with a finite numeric value.
[[nodiscard]] std::optional<std::pair<std::string, double>> parse_named_number(
    const std::string& text);

}  // namespace takoa::cli
