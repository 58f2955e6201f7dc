#include "finval/storage/inmemory_user_repository.h"

namespace finval::storage {

using UserResult = core::Result<domain::User, core::StorageError>;

UserResult InMemoryUserRepository::insert(const domain::User& user) {
  if (users_.contains(user.user_id) || by_email_.contains(user.email)) {
    return UserResult::err(core::StorageError::kConflict);
  }
  users_.emplace(user.user_id, user);
  by_email_.emplace(user.email, user.user_id);
  return UserResult::ok(user);
}

std::optional<domain::User> InMemoryUserRepository::get(const core::UserId& id) const {
  const auto it = users_.find(id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::User> InMemoryUserRepository::find_by_email(const std::string& email) const {
  const auto it = by_email_.find(email);
  if (it == by_email_.end()) {
    return std::nullopt;
  }
  return get(it->second);
}

}  // namespace finval::storage
