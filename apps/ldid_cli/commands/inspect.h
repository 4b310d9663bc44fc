#pragma once

// cmd_inspect: decode a canonical LDID string and print its fields
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
