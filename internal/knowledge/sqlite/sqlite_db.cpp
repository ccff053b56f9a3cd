#include "sqlite_db.hpp"

#include <utility>

namespace fabplan::knowledge::sqlite {

namespace {

[[noreturn]] void Raise(sqlite3* db, int rc, const std::string& context) {
  const char* detail = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  throw SqliteError(db ? sqlite3_extended_errcode(db) : rc, context + ": " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "cannot open knowledge store " + path_ + ": " + detail);
  }

  try {
    ApplyPragmas(options);
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string detail = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw SqliteError(sqlite3_extended_errcode(db_), "sqlite exec: " + detail);
  }
}

StatementPtr SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int     rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Raise(db_, rc, "sqlite prepare");
  }
  return StatementPtr(stmt, &sqlite3_finalize);
}

void SqliteDB::ApplyPragmas(const SqliteOptions& options) {
  // Planners keep reading while a seed import rewrites the catalog.
  if (!InMemory()) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  // Capability, material and run rows cascade from tools.
  Exec("PRAGMA foreign_keys=ON;");

  const int rc = sqlite3_busy_timeout(db_, options.busy_timeout_ms);
  if (rc != SQLITE_OK) {
    Raise(db_, rc, "sqlite busy_timeout");
  }
}

} // namespace fabplan::knowledge::sqlite
