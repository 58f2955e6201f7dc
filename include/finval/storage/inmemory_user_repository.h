#pragma once

#include "finval/storage/repositories.h"

#include <map>

namespace finval::storage {

// InMemoryUserRepository keeps users in a std::map keyed by UserId.
class InMemoryUserRepository final : public IUserRepository {
 public:
  core::Result<domain::User, core::StorageError> insert(const domain::User& user) override;
  [[nodiscard]] std::optional<domain::User> get(const core::UserId& id) const override;
  [[nodiscard]] std::optional<domain::User> find_by_email(
      const std::string& email) const override;

 private:
  std::map<core::UserId, domain::User> users_;
  std::map<std::string, core::UserId> by_email_;
};

}  // namespace finval::storage
