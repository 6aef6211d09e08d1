#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace avatarpool::db::sqlite {

using avatarpool::db::ErrorCode;
using avatarpool::db::Result;

namespace {

constexpr int kSchemaVersion = 1;

const char* const kAvatarColumns = "id,name,stored_filename,created_at_ms";

model::AvatarRecord ReadAvatar(const Statement& st) {
    model::AvatarRecord r;
    r.id = st.Text(0);
    r.name = st.Text(1);
    r.stored_filename = st.Text(2);
    r.created_at_ms = st.U64(3);
    return r;
}

model::BindingRecord ReadBinding(const Statement& st) {
    return model::BindingRecord{st.Text(0), st.Text(1)};
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
    static const std::vector<std::string> kBootstrapSql = {
        "CREATE TABLE IF NOT EXISTS avatars (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, name TEXT NOT NULL, stored_filename TEXT NOT NULL UNIQUE, created_at_ms INTEGER NOT NULL);",
        "CREATE TABLE IF NOT EXISTS avatar_bindings (user_id TEXT PRIMARY KEY, avatar_id TEXT NOT NULL);",
        "CREATE INDEX IF NOT EXISTS avatar_bindings_by_avatar ON avatar_bindings(avatar_id);"};

    const int found = db.SchemaVersion();
    if (found > kSchemaVersion) {
        throw avatarpool::util::IOFailure("sqlite schema version " + std::to_string(found) + " in '" + db.Path() +
                                          "' is newer than supported version " + std::to_string(kSchemaVersion));
    }

    for (const auto& sql : kBootstrapSql) {
        db.Exec(sql);
    }

    // fail fast on a table with the right name but the wrong shape
    db.Exec(std::string("SELECT ") + kAvatarColumns + " FROM avatars LIMIT 1;");
    db.Exec("SELECT user_id,avatar_id FROM avatar_bindings LIMIT 1;");

    if (found != kSchemaVersion) {
        db.SetSchemaVersion(kSchemaVersion);
        AVATARPOOL_LOG_INFO("Initialized avatar schema", {avatarpool::observability::StringField("path", db.Path()),
                                                          avatarpool::observability::IntField("version", kSchemaVersion)});
    }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Pool
// ------------------------------------------------------------------

Result SqliteRepository::InsertAvatar(Transaction& t, const model::AvatarRecord& r) {
    auto& tx = TX(t);
    Statement st(tx.Database(), std::string("INSERT INTO avatars(") + kAvatarColumns + ") VALUES(?,?,?,?);");

    st.BindText(1, r.id);
    st.BindText(2, r.name);
    st.BindText(3, r.stored_filename);
    st.BindU64(4, r.created_at_ms);

    const int rc = st.Step();
    if ((rc & 0xFF) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "avatar id or filename already exists");
    return Translate(tx.Handle(), rc);
}

std::optional<model::AvatarRecord>
SqliteRepository::GetAvatar(Transaction& t, const std::string& id) {
    Statement st(TX(t).Database(), std::string("SELECT ") + kAvatarColumns + " FROM avatars WHERE id=?;");
    st.BindText(1, id);

    if (st.Step() != SQLITE_ROW)
        return std::nullopt;
    return ReadAvatar(st);
}

std::vector<model::AvatarRecord>
SqliteRepository::ListAvatars(Transaction& t) {
    Statement st(TX(t).Database(), std::string("SELECT ") + kAvatarColumns + " FROM avatars ORDER BY seq;");

    std::vector<model::AvatarRecord> out;
    while (st.Step() == SQLITE_ROW) {
        out.push_back(ReadAvatar(st));
    }
    return out;
}

Result SqliteRepository::DeleteAvatar(Transaction& t, const std::string& id) {
    auto& tx = TX(t);
    Statement st(tx.Database(), "DELETE FROM avatars WHERE id=?;");
    st.BindText(1, id);

    auto result = Translate(tx.Handle(), st.Step());
    if (result && sqlite3_changes(tx.Handle()) == 0)
        return Result::Err(ErrorCode::NotFound, "avatar " + id);
    return result;
}

// ------------------------------------------------------------------
// Bindings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBinding(Transaction& t, const model::BindingRecord& r) {
    auto& tx = TX(t);
    Statement st(tx.Database(),
                 "INSERT INTO avatar_bindings(user_id,avatar_id) VALUES(?,?) "
                 "ON CONFLICT(user_id) DO UPDATE SET avatar_id=excluded.avatar_id;");

    st.BindText(1, r.user_id);
    st.BindText(2, r.avatar_id);
    return Translate(tx.Handle(), st.Step());
}

std::optional<model::BindingRecord>
SqliteRepository::GetBinding(Transaction& t, const std::string& user_id) {
    Statement st(TX(t).Database(), "SELECT user_id,avatar_id FROM avatar_bindings WHERE user_id=?;");
    st.BindText(1, user_id);

    if (st.Step() != SQLITE_ROW)
        return std::nullopt;
    return ReadBinding(st);
}

std::vector<model::BindingRecord>
SqliteRepository::ListBindings(Transaction& t) {
    Statement st(TX(t).Database(), "SELECT user_id,avatar_id FROM avatar_bindings ORDER BY user_id;");

    std::vector<model::BindingRecord> out;
    while (st.Step() == SQLITE_ROW) {
        out.push_back(ReadBinding(st));
    }
    return out;
}

Result SqliteRepository::DeleteBinding(Transaction& t, const std::string& user_id) {
    auto& tx = TX(t);
    Statement st(tx.Database(), "DELETE FROM avatar_bindings WHERE user_id=?;");
    st.BindText(1, user_id);
    return Translate(tx.Handle(), st.Step());
}

Result SqliteRepository::DeleteBindingsForAvatar(Transaction& t, const std::string& avatar_id, uint64_t* removed) {
    auto& tx = TX(t);
    Statement st(tx.Database(), "DELETE FROM avatar_bindings WHERE avatar_id=?;");
    st.BindText(1, avatar_id);

    auto result = Translate(tx.Handle(), st.Step());
    if (result && removed)
        *removed = static_cast<uint64_t>(sqlite3_changes(tx.Handle()));
    return result;
}

} // namespace avatarpool::db::sqlite
