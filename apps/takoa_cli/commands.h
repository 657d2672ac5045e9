#pragma once

#include "cli_config.h"
#include "engine_runtime.h"

namespace takoa::cli {

// Each command prints its result as JSON on stdout and diagnostics on stderr.
// Return value is the process exit code: 0 success, 1 engine or storage error.

int cmd_onboard(const CliConfig& config, EngineRuntime& rt);
int cmd_turn(const CliConfig& config, EngineRuntime& rt);
int cmd_neighbors(const CliConfig& config, EngineRuntime& rt);
int cmd_explain(const CliConfig& config, EngineRuntime& rt);
int cmd_cohesion(const CliConfig& config, EngineRuntime& rt);
int cmd_clusters(const CliConfig& config, EngineRuntime& rt);
int cmd_graph(const CliConfig& config, EngineRuntime& rt);
int cmd_export(const CliConfig& config, EngineRuntime& rt);

// Checks the hash chain of every stored trace.
int cmd_verify_audit(const CliConfig& config, EngineRuntime& rt);

}  // namespace takoa::cli
