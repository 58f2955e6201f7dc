#pragma once

// cmd_signup: interactive signup on stdin.
// Usage: finval_cli signup [--db <db-path>] [--deterministic]
int cmd_signup(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
