#include "sqlite_identity_provider.hpp"

#include <stdexcept>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::identity {

using avatarpool::db::sqlite::SqliteDB;
using avatarpool::db::sqlite::SqliteTransaction;
using avatarpool::db::sqlite::Statement;

namespace {

User ReadUser(const Statement& st) {
  return User{st.Text(0), st.Text(1), st.OptionalText(2)};
}

} // namespace

SqliteIdentityProvider::SqliteIdentityProvider(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS users (id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', profile_image_path TEXT);");
}

std::optional<User> SqliteIdentityProvider::GetUser(const std::string& id) {
  SqliteTransaction tx(db_);
  std::optional<User> user;
  {
    Statement st(*db_, "SELECT id,name,profile_image_path FROM users WHERE id=?;");
    st.BindText(1, id);
    if (st.Step() == SQLITE_ROW) {
      user = ReadUser(st);
    }
  }
  tx.Commit();
  return user;
}

std::vector<User> SqliteIdentityProvider::ListUsers() {
  SqliteTransaction tx(db_);
  std::vector<User> users;
  {
    Statement st(*db_, "SELECT id,name,profile_image_path FROM users ORDER BY id;");
    while (st.Step() == SQLITE_ROW) {
      users.push_back(ReadUser(st));
    }
  }
  tx.Commit();
  return users;
}

void SqliteIdentityProvider::PersistUser(const User& user) {
  SqliteTransaction tx(db_);
  {
    Statement st(*db_, "UPDATE users SET name=?,profile_image_path=? WHERE id=?;");
    st.BindText(1, user.name);
    st.BindOptionalText(2, user.profile_image_path);
    st.BindText(3, user.id);
    if (st.Step() != SQLITE_DONE) {
      throw avatarpool::util::IOFailure(std::string("persist user: ") + st.Error());
    }
    if (sqlite3_changes(db_->Handle()) == 0) {
      throw avatarpool::util::UserNotFound("persist user: unknown user " + user.id);
    }
  }
  tx.Commit();
}

void SqliteIdentityProvider::UpsertUser(const User& user) {
  SqliteTransaction tx(db_);
  {
    Statement st(*db_,
                 "INSERT INTO users(id,name,profile_image_path) VALUES(?,?,?) "
                 "ON CONFLICT(id) DO UPDATE SET name=excluded.name,profile_image_path=excluded.profile_image_path;");
    st.BindText(1, user.id);
    st.BindText(2, user.name);
    st.BindOptionalText(3, user.profile_image_path);
    if (st.Step() != SQLITE_DONE) {
      throw avatarpool::util::IOFailure(std::string("upsert user: ") + st.Error());
    }
  }
  tx.Commit();
}

} // namespace avatarpool::identity
