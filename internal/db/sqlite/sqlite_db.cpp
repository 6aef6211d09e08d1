#include "sqlite_db.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::db::sqlite {

constexpr int kBusyTimeoutMs = 5000;

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(SqliteDB& db, const std::string& sql) : db_(db) {
  if (sqlite3_prepare_v2(db_.Handle(), sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
    const std::string detail = sqlite3_errmsg(db_.Handle());
    sqlite3_finalize(st_);
    db_.Fail("prepare", detail);
  }
}

Statement::~Statement() {
  sqlite3_finalize(st_);
}

void Statement::BindText(int idx, const std::string& value) {
  sqlite3_bind_text(st_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindOptionalText(int idx, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(idx, *value);
  } else {
    sqlite3_bind_null(st_, idx);
  }
}

void Statement::BindU64(int idx, uint64_t value) {
  sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(value));
}

std::string Statement::Text(int col) const {
  const unsigned char* text = sqlite3_column_text(st_, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> Statement::OptionalText(int col) const {
  if (sqlite3_column_type(st_, col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return Text(col);
}

uint64_t Statement::U64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
}

int Statement::Step() {
  return sqlite3_step(st_);
}

const char* Statement::Error() const {
  return sqlite3_errmsg(db_.Handle());
}

// ------------------------------------------------------------------
// SqliteDB
// ------------------------------------------------------------------

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    Fail("open", detail);
  }

  Configure();
  AVATARPOOL_LOG_DEBUG("Opened sqlite database", {avatarpool::observability::StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_ && sqlite3_close(db_) != SQLITE_OK) {
    AVATARPOOL_LOG_WARN("sqlite close failed", {avatarpool::observability::StringField("path", path_),
                                                avatarpool::observability::StringField("error", sqlite3_errmsg(db_))});
  }
}

void SqliteDB::Fail(const std::string& what, const std::string& detail) const {
  throw avatarpool::util::IOFailure("sqlite " + what + " '" + path_ + "': " + detail);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    Fail("exec", detail);
  }
}

int SqliteDB::SchemaVersion() {
  Statement st(*this, "PRAGMA user_version;");
  if (st.Step() != SQLITE_ROW) {
    Fail("read user_version", st.Error());
  }
  return static_cast<int>(sqlite3_column_int(st.get(), 0));
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  Exec("PRAGMA journal_mode=WAL;");

  // a reported success must survive an immediate crash
  Exec("PRAGMA synchronous=FULL;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    Fail("busy_timeout", sqlite3_errmsg(db_));
  }

  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace avatarpool::db::sqlite
