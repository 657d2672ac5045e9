#include "cli_config.h"
#include "commands.h"
#include "engine_runtime.h"
#include "startup_guard.h"

#include <curl/curl.h>

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

namespace {

using Command = std::function<int(const takoa::cli::CliConfig&, takoa::cli::EngineRuntime&)>;

const std::map<std::string, Command>& commands() {
  static const std::map<std::string, Command> table = {
      {"onboard", takoa::cli::cmd_onboard},
      {"turn", takoa::cli::cmd_turn},
      {"neighbors", takoa::cli::cmd_neighbors},
      {"explain", takoa::cli::cmd_explain},
      {"cohesion", takoa::cli::cmd_cohesion},
      {"clusters", takoa::cli::cmd_clusters},
      {"graph", takoa::cli::cmd_graph},
      {"export", takoa::cli::cmd_export},
      {"verify-audit", takoa::cli::cmd_verify_audit},
  };
  return table;
}

void print_usage() {
  std::cerr << "takoa v" << TAKOA_VERSION << "\n"
            << "Usage: takoa_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  onboard       create a person   [--id] [--name] [--age] [--uni] [--interest]...\n"
            << "                                  [--trait name=v]... [--confidence]\n"
            << "  turn          apply one turn    --id --confidence [--signal name=v]... [--message]\n"
            << "  neighbors     top-k similar     --id [--k]\n"
            << "  explain       match breakdown   --id --other\n"
            << "  cohesion      group similarity  --member --member ...\n"
            << "  clusters      DBSCAN labels\n"
            << "  graph         display graph     [--mode force|embedding] [--k]\n"
            << "  export        dump all persons\n"
            << "  verify-audit  check audit hash chains\n\n"
            << "Options:\n";
  takoa::apps::print_options(std::cerr, takoa::cli::cli_options());
}

// curl_global_init is not thread-safe and must precede any easy handle.
struct CurlGlobal {
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
  CurlGlobal(CurlGlobal&&) = delete;
  CurlGlobal& operator=(CurlGlobal&&) = delete;
};

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(bugprone-exception-escape)
  if (argc < 2) {
    print_usage();
    return 2;
  }

  const std::string command = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto it = commands().find(command);
  if (it == commands().end()) {
    if (command != "--help" && command != "-h") {
      std::cerr << "Unknown command: " << command << "\n\n";
    }
    print_usage();
    return 2;
  }

  const auto config = takoa::apps::parse_options(argc, argv, takoa::cli::cli_options(), 2);
  if (!config.has_value()) {
    return 2;
  }

  const std::string guard_error = takoa::cli::validate_cli_config(command, config.value());
  if (!guard_error.empty()) {
    std::cerr << guard_error << "\n";
    return 2;
  }

  const CurlGlobal curl;

  auto runtime = takoa::cli::EngineRuntime::create(config.value());
  if (!runtime.has_value()) {
    std::cerr << "Error: " << runtime.error() << "\n";
    return 1;
  }
  if (runtime.value()->ephemeral()) {
    std::cerr << "WARNING: no --db or --redis given; storage is EPHEMERAL and this run's "
                 "changes will be lost\n";
  }

  try {
    return it->second(config.value(), *runtime.value());
  } catch (const std::runtime_error& e) {
    std::cerr << "Error (storage): " << e.what() << "\n";
    return 1;
  }
}
