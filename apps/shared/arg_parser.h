#pragma once

#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace ldid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false when the value is rejected; rejected values are
// recorded in ParsedOptions::errors and parsing continues with the next token.
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
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;      // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag to its
// handler, and collects everything else: non-flag tokens into positional, unknown flags,
// missing values and rejected values into errors. The caller decides how to report.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 2,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      } else {
        parsed.positional.push_back(arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      if (!opt->handler(parsed.config, "")) {
        parsed.errors.push_back("Option " + arg + " rejected");
      }
      continue;
    }
    if (i + 1 >= argc) {
      parsed.errors.push_back("Option " + arg + " requires a value");
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": " + value);
    }
  }

  return parsed;
}

// parse_unsigned accepts decimal, or hexadecimal with a 0x/0X prefix.
// Returns nullopt on empty input, trailing garbage, or overflow.
inline std::optional<std::uint64_t> parse_unsigned(std::string_view text) {
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace ldid::apps
