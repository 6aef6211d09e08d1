#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace avatarpool::db::sqlite {

// Creates the avatars / avatar_bindings tables if missing.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAvatar(Transaction&, const model::AvatarRecord&) override;
  std::optional<model::AvatarRecord> GetAvatar(Transaction&, const std::string&) override;
  std::vector<model::AvatarRecord> ListAvatars(Transaction&) override;
  Result DeleteAvatar(Transaction&, const std::string&) override;

  Result UpsertBinding(Transaction&, const model::BindingRecord&) override;
  std::optional<model::BindingRecord> GetBinding(Transaction&, const std::string&) override;
  std::vector<model::BindingRecord> ListBindings(Transaction&) override;
  Result DeleteBinding(Transaction&, const std::string&) override;
  Result DeleteBindingsForAvatar(Transaction&, const std::string& avatar_id, uint64_t* removed) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
