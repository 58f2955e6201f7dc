#pragma once

#include "finval/core/clock.h"
#include "finval/core/id_generator.h"
#include "finval/core/services.h"

#include <iosfwd>
#include <string>

// Account subcommands. Take only interface types; no concrete storage headers
// may be included in this TU.

int execute_create_account(const std::string& user_id, const std::string& account_type,
                           std::ostream& out, finval::core::Services& services,
                           finval::core::IIdGenerator& id_gen, finval::core::IClock& clock);

int execute_list_accounts(const std::string& user_id, std::ostream& out,
                          finval::core::Services& services);

// execute_fund prompts for the amount and the funding source, re-prompting each
// field until it is valid, then deposits into the account.
int execute_fund(std::istream& in, std::ostream& out, const std::string& user_id,
                 const std::string& account_id, finval::core::Services& services,
                 finval::core::IIdGenerator& id_gen, finval::core::IClock& clock);

int execute_list_transactions(const std::string& user_id, const std::string& account_id,
                              std::ostream& out, finval::core::Services& services);
