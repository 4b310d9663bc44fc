#include "ldid/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "Usage: ldid_cli <command> [options]\n"
        "\n"
        "Commands:\n"
        "  generate [--count N] [--json] [--verbose]\n"
        "           [--fixed-time MS --fixed-random V]   Print new LDIDs\n"
        "  inspect <id> [--json]                         Decode an LDID string\n"
        "  version                                       Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "version" || subcommand == "--version") {
    std::cout << "ldid v" << ldid::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "help" || subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return 1;
}
