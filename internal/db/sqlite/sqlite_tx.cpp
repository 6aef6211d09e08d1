#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), writer_lock_(db_->WriterMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    RollbackQuietly();
  }
}

void SqliteTransaction::RollbackQuietly() {
  finished_ = true;
  if (sqlite3_get_autocommit(db_->Handle())) {
    return; // sqlite already ended the transaction
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    AVATARPOOL_LOG_WARN("sqlite rollback failed", {avatarpool::observability::StringField("path", db_->Path()),
                                                   avatarpool::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw avatarpool::util::InvariantViolation("sqlite transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    RollbackQuietly();
    throw;
  }
  committed_ = true;
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace avatarpool::db::sqlite
