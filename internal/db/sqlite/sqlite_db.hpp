#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace alarmsrv::db::sqlite {

struct SqliteOptions {
  std::string path;

  // how long a statement waits on a locked database before SQLITE_BUSY
  uint32_t busy_timeout_ms = 5000;

  // upper bound on pooled connections
  uint32_t max_connections = 8;

  // PRAGMA synchronous: OFF, NORMAL, FULL or EXTRA
  std::string synchronous = "NORMAL";
};

/*
  Thin RAII wrapper around one sqlite3* connection.

  Opening creates the file and its parent directories if needed and
  switches the database into WAL mode. Failure to do any of that throws:
  the store cannot serve requests without it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(const SqliteOptions& options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws util::StorageUnavailable on busy/I-O failures, std::runtime_error otherwise.
  void Exec(const std::string& sql);

  // Like Exec but reports failure instead of throwing.
  bool TryExec(const std::string& sql, std::string* error = nullptr) noexcept;

  // First column of the first row, empty if no row.
  std::string QueryText(const std::string& sql);

  // Current PRAGMA journal_mode, lower case.
  std::string JournalMode();

  // true while a transaction is open on this connection
  bool InTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
  }

 private:
  // Configure PRAGMAs (WAL, synchronous, foreign keys, busy timeout)
  void Configure(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Maps a failed sqlite result code to the error the caller sees.
[[noreturn]] void ThrowSqliteError(sqlite3* db, int rc, const std::string& what);

} // namespace alarmsrv::db::sqlite
