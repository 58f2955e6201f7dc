#pragma once

// Account subcommands. All need --user-id; storage flags as for signup.
//
// Usage: finval_cli create-account --user-id <id> --type checking|savings [--db <db-path>]
int cmd_create_account(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Usage: finval_cli accounts --user-id <id> [--db <db-path>]
int cmd_list_accounts(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Interactive deposit; prompts for the amount and the funding source on stdin.
// Usage: finval_cli fund --user-id <id> --account-id <id> [--db <db-path>]
int cmd_fund(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// Usage: finval_cli transactions --user-id <id> --account-id <id> [--db <db-path>]
int cmd_transactions(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
