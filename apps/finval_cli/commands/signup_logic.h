#pragma once

#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/password_hash.h"
#include "finval/core/services.h"

#include <iosfwd>

// execute_signup prompts for every signup field in form order, re-prompting a
// field until it is valid, then runs the signup flow and prints the created user.
// Takes only interface types; no concrete storage headers may be included in this TU.
int execute_signup(std::istream& in, std::ostream& out, finval::core::Services& services,
                   finval::core::IIdGenerator& id_gen, finval::core::IClock& clock,
                   finval::core::ISaltSource& salts);
