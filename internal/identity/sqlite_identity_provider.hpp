#pragma once

#include <memory>

#include "identity_provider.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace avatarpool::identity {

/*
  Identity provider backed by the host's user table:

    users(id TEXT PRIMARY KEY, name TEXT, profile_image_path TEXT NULL)

  The table is created if missing so a fresh deployment can be seeded with
  avatarctl.
*/
class SqliteIdentityProvider final : public IdentityProvider {
 public:
  explicit SqliteIdentityProvider(std::shared_ptr<avatarpool::db::sqlite::SqliteDB> db);

  std::optional<User> GetUser(const std::string& id) override;
  std::vector<User>   ListUsers() override;
  void                PersistUser(const User& user) override;

  // Inserts or replaces a user row.
  void UpsertUser(const User& user);

 private:
  std::shared_ptr<avatarpool::db::sqlite::SqliteDB> db_;
};

} // namespace avatarpool::identity
