#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace avatarpool::db::sqlite {

class SqliteDB;

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  void BindText(int idx, const std::string& value);
  void BindOptionalText(int idx, const std::optional<std::string>& value);
  void BindU64(int idx, uint64_t value);

  std::string Text(int col) const;
  // nullopt for SQL NULL
  std::optional<std::string> OptionalText(int col) const;
  uint64_t                   U64(int col) const;

  // SQLITE_ROW, SQLITE_DONE or an error code.
  int Step();

  const char* Error() const;

 private:
  SqliteDB&     db_;
  sqlite3_stmt* st_ = nullptr;
};

/*
  Owns the sqlite3 connection for one database file.

  One connection is shared by the avatar repository and the identity
  provider; every transaction holds WriterMutex() for its whole lifetime.
  Failures are reported as util::IOFailure naming the database path.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  void Exec(const std::string& sql);

  // PRAGMA user_version
  int  SchemaVersion();
  void SetSchemaVersion(int version);

 private:
  // WAL, synchronous=FULL, busy timeout
  void Configure();

  [[noreturn]] void Fail(const std::string& what, const std::string& detail) const;

  friend class Statement;

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace avatarpool::db::sqlite
