#include "generate.h"

#include "ldid/core/version.h"
#include "ldid/id/generator.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using ldid::cli::GenerateConfig;

  const std::vector<ldid::apps::Option<GenerateConfig>> options = {
      {"--count", true, "Number of LDIDs to print (default 1)",
       [](GenerateConfig& c, const std::string& v) {
         const auto n = ldid::apps::parse_unsigned(v);
         if (!n.has_value()) {
           return false;
         }
         c.count = n.value();
         return true;
       }},
      {"--json", false, "Print a JSON array of decoded fields",
       [](GenerateConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--verbose", false, "Print generator diagnostics to stderr",
       [](GenerateConfig& c, const std::string&) {
         c.verbose = true;
         return true;
       }},
      {"--fixed-time", true, "Use a fixed timestamp (ms since epoch)",
       [](GenerateConfig& c, const std::string& v) {
         c.fixed_time_ms = ldid::apps::parse_unsigned(v);
         return c.fixed_time_ms.has_value();
       }},
      {"--fixed-random", true, "Use a fixed raw random value (decimal or 0x hex)",
       [](GenerateConfig& c, const std::string& v) {
         c.fixed_random = ldid::apps::parse_unsigned(v);
         return c.fixed_random.has_value();
       }},
  };
  const auto parsed = ldid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }
  if (!parsed.positional.empty()) {
    std::cerr << "Error: unexpected argument '" << parsed.positional.front() << "'\n";
    return 1;
  }

  const GenerateConfig& config = parsed.config;
  const std::string config_error = ldid::cli::validate_generate_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  std::unique_ptr<ldid::id::IGenerator> generator;
  if (config.fixed_time_ms.has_value()) {
    generator = std::make_unique<ldid::id::FixedGenerator>(config.fixed_time_ms.value(),
                                                           config.fixed_random.value());
  } else {
    generator = std::make_unique<ldid::id::SystemGenerator>();
  }

  if (config.verbose) {
    std::cerr << "ldid v" << ldid::core::kBuildVersion << "\n";
    if (config.fixed_time_ms.has_value()) {
      std::cerr << "WARNING: fixed generator in use. Every LDID in this run is identical.\n";
    } else {
      std::cerr << "Generator:   system clock + getrandom(2)\n";
    }
    std::cerr << "Count:       " << config.count << "\n";
  }

  return ldid::cli::execute_generate(config, *generator, std::cout, std::cerr);
}
