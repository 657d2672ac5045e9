#pragma once

#include "cli_config.h"

#include <string>

namespace takoa::cli {

// validate_cli_config checks flag combinations before anything is opened.
//
// Returns "" on success, otherwise the first problem found as a message ready
// for stderr. Checked:
// - --db and --redis are mutually exclusive
// - a --redis URI parses
// - --embedding-model needs --embedding-url
// - the command's own required flags are present (see usage)
[[nodiscard]] std::string validate_cli_config(const std::string& command,
                                              const CliConfig& config);

}  // namespace takoa::cli
