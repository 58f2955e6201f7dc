#pragma once

#include "finval/validation/field_rules.h"

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

using FieldCheck =
    std::function<finval::validation::FieldFinding(std::optional<std::string_view> raw)>;

// prompt_until_valid asks for label until check accepts the entered line.
// Every rejection prints the finding's message and asks again.
// Returns the accepted line as typed, or std::nullopt when input ends.
std::optional<std::string> prompt_until_valid(std::istream& in, std::ostream& out,
                                              const std::string& label, const FieldCheck& check);
