#include "finval/app/backend.h"

#include "finval/storage/inmemory_account_repository.h"
#include "finval/storage/inmemory_user_repository.h"
#include "finval/storage/sqlite/sqlite_account_repository.h"
#include "finval/storage/sqlite/sqlite_audit_log.h"
#include "finval/storage/sqlite/sqlite_db.h"
#include "finval/storage/sqlite/sqlite_user_repository.h"

namespace finval::app {

struct Backend::Parts {
  std::shared_ptr<storage::sqlite::SqliteDb> db;
  std::unique_ptr<storage::IUserRepository> users;
  std::unique_ptr<storage::IAccountRepository> accounts;
  std::unique_ptr<storage::IAuditLog> audit_log;
};

Backend::Backend(std::unique_ptr<Parts> parts, const bool persistent)
    : parts_(std::move(parts)),
      services_(std::make_unique<core::Services>(*parts_->users, *parts_->accounts,
                                                 *parts_->audit_log)),
      persistent_(persistent) {}

Backend::~Backend() = default;

core::Result<std::shared_ptr<Backend>, std::string> Backend::open(
    const std::optional<std::string>& db_path) {
  using OpenResult = core::Result<std::shared_ptr<Backend>, std::string>;

  auto parts = std::make_unique<Parts>();

  if (!db_path.has_value()) {
    parts->users = std::make_unique<storage::InMemoryUserRepository>();
    parts->accounts = std::make_unique<storage::InMemoryAccountRepository>();
    parts->audit_log = std::make_unique<storage::InMemoryAuditLog>();
    return OpenResult::ok(std::shared_ptr<Backend>(new Backend(std::move(parts), false)));
  }

  auto db_result = storage::sqlite::SqliteDb::open(*db_path);
  if (!db_result.has_value()) {
    return OpenResult::err(db_result.error());
  }
  auto db = db_result.value();
  auto schema_result = db->ensure_schema();
  if (!schema_result.has_value()) {
    return OpenResult::err("Failed to initialize schema: " + schema_result.error());
  }

  parts->db = db;
  parts->users = std::make_unique<storage::sqlite::SqliteUserRepository>(db);
  parts->accounts = std::make_unique<storage::sqlite::SqliteAccountRepository>(db);
  parts->audit_log = std::make_unique<storage::sqlite::SqliteAuditLog>(db);
  return OpenResult::ok(std::shared_ptr<Backend>(new Backend(std::move(parts), true)));
}

}  // namespace finval::app
