#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace mprisrelay::db::sqlite {

using mprisrelay::db::ErrorCode;
using mprisrelay::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::vector<std::uint8_t>& b) {
    sqlite3_bind_blob(st, idx, b.data(), static_cast<int>(b.size()), SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::vector<std::uint8_t> ColBlob(sqlite3_stmt* st, int col) {
    const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(st, col));
    const int   size = sqlite3_column_bytes(st, col);
    if (!data || size <= 0) return {};
    return std::vector<std::uint8_t>(data, data + size);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static model::TrustRecord ReadRow(sqlite3_stmt* st) {
    model::TrustRecord r;
    r.identity = ColText(st, 0);
    r.public_key = ColBlob(st, 1);
    r.trust_key = ColBlob(st, 2);
    r.client_name = ColText(st, 3);
    r.created_at_ms = ColI64(st, 4);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec("CREATE TABLE IF NOT EXISTS trust_record (identity TEXT PRIMARY KEY, public_key BLOB NOT NULL, trust_key BLOB NOT NULL, client_name TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);");
    db.Exec("CREATE TABLE IF NOT EXISTS trust_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");
    db.Exec("INSERT OR IGNORE INTO trust_schema_migrations(version, applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);");

    // fail fast on a file created by an incompatible build
    db.Exec("SELECT identity,public_key,trust_key,client_name,created_at_ms FROM trust_record LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

static Result RequireWrite(const Transaction& t) {
    if (t.Mode() != TxMode::kWrite)
        return Result::Err(ErrorCode::ReadOnly, "trust_record");
    return Result::Ok();
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
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Trust records
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTrust(Transaction& t, const model::TrustRecord& r) {
    if (auto writable = RequireWrite(t); !writable) return writable;
    auto* db = TX(t).Handle();

    // REPLACE deletes the old row and inserts the new one in one statement
    const char* sql =
        "INSERT OR REPLACE INTO trust_record(identity,public_key,trust_key,client_name,created_at_ms) VALUES(?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.identity);
    BindBlob(st, 2, r.public_key);
    BindBlob(st, 3, r.trust_key);
    BindText(st, 4, r.client_name);
    BindI64(st, 5, r.created_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::TrustRecord>
SqliteRepository::GetTrust(Transaction& t, const std::string& identity) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT identity,public_key,trust_key,client_name,created_at_ms FROM trust_record WHERE identity=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st, 1, identity);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE)
            throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::TrustRecord> SqliteRepository::ListTrust(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT identity,public_key,trust_key,client_name,created_at_ms FROM trust_record ORDER BY created_at_ms, identity;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    std::vector<model::TrustRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    return out;
}

Result SqliteRepository::DeleteTrust(Transaction& t, const std::string& identity) {
    if (auto writable = RequireWrite(t); !writable) return writable;
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM trust_record WHERE identity=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, identity);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result) return result;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

std::size_t SqliteRepository::DeleteAllTrust(Transaction& t) {
    if (t.Mode() != TxMode::kWrite)
        throw std::logic_error("DeleteAllTrust inside a read transaction");
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM trust_record;", -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (!result)
        throw std::runtime_error("sqlite delete failed: " + result.message);
    return static_cast<std::size_t>(sqlite3_changes(db));
}

} // namespace mprisrelay::db::sqlite
