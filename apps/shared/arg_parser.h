#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace takoa::apps {

// One command-line flag. Config is the caller's settings struct; handler stores
// the flag's value into it and returns false when the value is unacceptable.
// Flags may repeat; the handler runs once per occurrence.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options walks argv[start..argc-1] and dispatches known flags.
//
// Returns nullopt when a flag is unknown, lacks its value, or its handler
// rejects the value; each problem is reported to stderr first. Bare tokens
// are collected into positional when given, otherwise ignored.
template <typename Config>
std::optional<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {},
                                    std::vector<std::string>* positional = nullptr) {
  Config config = std::move(default_config);
  bool ok = true;

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = by_name.find(arg);
    if (it == by_name.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        ok = false;
      } else if (positional != nullptr) {
        positional->push_back(arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        std::cerr << "Option " << arg << " requires a value\n";
        ok = false;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(config, value)) {
      std::cerr << "Invalid value for " << arg << ": '" << value << "'\n";
      ok = false;
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  return config;
}

// One line per option, for usage text.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace takoa::apps
