#pragma once

#include <ostream>
#include <string>

namespace ldid::cli {

// execute_inspect parses a canonical LDID string and prints its fields to out, as a
// labelled table or as JSON. Parse failures go to err with exit code 1.
// Values whose version/variant tags differ from an LDID's are still printed, with a
// warning on err, since any UUID-shaped string parses.
int execute_inspect(const std::string& text, bool json, std::ostream& out, std::ostream& err);

}  // namespace ldid::cli
