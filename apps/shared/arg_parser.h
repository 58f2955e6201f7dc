#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace finval::apps {

// Option describes one command-line flag. handler returns false when the value
// is rejected; it reports nothing itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;       // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options walks argv[start..argc-1]. Registered flags are dispatched to
// their handlers; other tokens starting with "--" are errors; everything else is
// kept as a positional argument in order.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config defaults = {}) {
  ParsedOptions<Config> parsed{std::move(defaults), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = by_name.find(arg);
    if (it == by_name.end()) {
      if (arg.rfind("--", 0) == 0) {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positionals.push_back(arg);
      }
      continue;
    }

    const Option<Config>& opt = *it->second;
    std::string value;
    if (opt.requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt.handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": " + value);
    }
  }

  return parsed;
}

// usage_lines renders "  <name> [value]  <description>" for every option.
template <typename Config>
std::vector<std::string> usage_lines(const std::vector<Option<Config>>& options) {
  std::vector<std::string> lines;
  lines.reserve(options.size());
  for (const auto& opt : options) {
    lines.push_back("  " + opt.name + (opt.requires_value ? " <value>" : "") + "  " +
                    opt.description);
  }
  return lines;
}

}  // namespace finval::apps
