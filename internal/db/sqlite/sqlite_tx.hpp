#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace avatarpool::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on a shared connection.

  The connection's writer mutex is taken before BEGIN and released when the
  object dies, so one thread at a time owns the connection. A failed COMMIT
  is rolled back before the error propagates.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteDB& Database() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void RollbackQuietly();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> writer_lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
