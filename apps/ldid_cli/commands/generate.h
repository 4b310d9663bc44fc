#pragma once

// cmd_generate: print one or more freshly generated LDIDs
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
