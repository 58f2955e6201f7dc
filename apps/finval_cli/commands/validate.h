#pragma once

// cmd_validate: validate and normalize one field value.
// Usage: finval_cli validate <field> [<value>]
// field: amount | card_number | routing_number | phone_number | password | state
// An omitted value is validated as missing.
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_states: list accepted state codes.
// Usage: finval_cli states
int cmd_states(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
