#include "inspect.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  bool json{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  // Usage: ldid_cli inspect <id> [--json]
  const std::vector<ldid::apps::Option<InspectCliConfig>> options = {
      {"--json", false, "Print decoded fields as JSON",
       [](InspectCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  const auto parsed = ldid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    return 1;
  }
  if (parsed.positional.size() != 1) {
    std::cerr << "Usage: ldid_cli inspect <id> [--json]\n";
    return 1;
  }

  return ldid::cli::execute_inspect(parsed.positional.front(), parsed.config.json, std::cout,
                                    std::cerr);
}
