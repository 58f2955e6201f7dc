#pragma once

#ifdef FINVAL_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "finval/storage/repositories.h"
#include "finval/storage/sqlite/sqlite_db.h"

#include <memory>

namespace finval::storage::sqlite {

// SqliteUserRepository implements IUserRepository on the users table.
// The UNIQUE(email) constraint makes duplicate registration a kConflict even
// when two signups race past the flow's pre-check.
class SqliteUserRepository final : public IUserRepository {
 public:
  explicit SqliteUserRepository(std::shared_ptr<SqliteDb> db);

  core::Result<domain::User, core::StorageError> insert(const domain::User& user) override;
  [[nodiscard]] std::optional<domain::User> get(const core::UserId& id) const override;
  [[nodiscard]] std::optional<domain::User> find_by_email(
      const std::string& email) const override;

 private:
  [[nodiscard]] std::optional<domain::User> select_one(const char* where,
                                                       const std::string& key) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace finval::storage::sqlite
