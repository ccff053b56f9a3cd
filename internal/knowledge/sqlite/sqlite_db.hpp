#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace fabplan::knowledge::sqlite {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Failed sqlite call; Code() is the extended result code.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& message) : std::runtime_error(message), code_(code) {
  }

  int Code() const {
    return code_;
  }

 private:
  int code_;
};

struct SqliteOptions {
  // How long a writer waits for a competing lock before SQLITE_BUSY.
  int busy_timeout_ms = 5000;
};

/*
  Owns one sqlite3 connection to the knowledge store.

  ":memory:" opens a private in-memory database; WAL is skipped for it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  // Runs one or more statements without results. Throws SqliteError.
  void Exec(const std::string& sql);

  // Throws SqliteError when the statement does not compile.
  StatementPtr Prepare(const std::string& sql);

 private:
  void ApplyPragmas(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace fabplan::knowledge::sqlite
