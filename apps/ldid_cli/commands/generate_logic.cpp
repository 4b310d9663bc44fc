#include "generate_logic.h"

#include "ldid/id/ldid.h"
#include "ldid/id/ldid_json.h"

#include <nlohmann/json.hpp>

namespace ldid::cli {

std::string validate_generate_config(const GenerateConfig& config) {
  if (config.count < 1 || config.count > kMaxGenerateCount) {
    return "Error: --count must be between 1 and " + std::to_string(kMaxGenerateCount);
  }
  if (config.fixed_time_ms.has_value() != config.fixed_random.has_value()) {
    return "Error: --fixed-time and --fixed-random must be given together";
  }
  return "";
}

int execute_generate(const GenerateConfig& config, id::IGenerator& generator, std::ostream& out,
                     std::ostream& err) {
  auto records = nlohmann::json::array();

  for (std::uint64_t i = 0; i < config.count; ++i) {
    const auto result = id::Ldid::create(generator);
    if (!result.has_value()) {
      err << "Error: failed to generate LDID: " << core::describe(result.error()) << "\n";
      return 1;
    }

    if (config.json) {
      records.push_back(id::ldid_to_json(result.value()));
    } else {
      out << result.value().to_string() << "\n";
    }
  }

  if (config.json) {
    out << records.dump(2) << "\n";
  }
  return 0;
}

}  // namespace ldid::cli
