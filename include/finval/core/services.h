#pragma once

#include "finval/storage/audit_log.h"
#include "finval/storage/repositories.h"

namespace finval::core {

// Services bundles the persistence collaborators a flow needs.
// It holds references only; the entry point owns the concrete instances.
struct Services {
  storage::IUserRepository& users;        // NOLINT(readability-identifier-naming)
  storage::IAccountRepository& accounts;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;          // NOLINT(readability-identifier-naming)

  Services(storage::IUserRepository& users, storage::IAccountRepository& accounts,
           storage::IAuditLog& audit_log)
      : users(users), accounts(accounts), audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace finval::core
