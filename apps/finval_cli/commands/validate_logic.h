#pragma once

#include <iosfwd>
#include <optional>
#include <string>

// execute_validate prints the finding for one field as JSON.
// Returns 0 when the value is valid, 1 when it is not or the field is unknown.
int execute_validate(const std::string& field_name, const std::optional<std::string>& value,
                     std::ostream& out);

// execute_states prints the accepted state codes by category.
int execute_states(std::ostream& out);
