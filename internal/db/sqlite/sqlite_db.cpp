#include "sqlite_db.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"

namespace alarmsrv::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    ThrowSqliteError(db, rc, what);
  }
}

bool IsUnavailable(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
    case SQLITE_READONLY:
      return true;
    default:
      return false;
  }
}

std::string NormalizeSynchronous(std::string mode) {
  std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (mode.empty()) {
    return "NORMAL";
  }
  if (mode != "OFF" && mode != "NORMAL" && mode != "FULL" && mode != "EXTRA") {
    throw std::runtime_error("sqlite: unsupported synchronous mode '" + mode + "'");
  }
  return mode;
}

void EnsureParentDirectory(const std::string& path) {
  if (path.empty() || path == ":memory:") {
    return;
  }
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

void ThrowSqliteError(sqlite3* db, int rc, const std::string& what) {
  std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if (IsUnavailable(rc)) {
    throw util::StorageUnavailable(msg);
  }
  throw std::runtime_error(msg);
}

SqliteDB::SqliteDB(const SqliteOptions& options) : path_(options.path) {
  if (path_.empty()) {
    throw std::runtime_error("sqlite: database path is empty");
  }
  EnsureParentDirectory(path_);

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite: cannot open " + path_ + ": " + msg);
  }

  try {
    Configure(options);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (IsUnavailable(rc)) {
      throw util::StorageUnavailable(msg);
    }
    throw std::runtime_error(msg);
  }
}

bool SqliteDB::TryExec(const std::string& sql, std::string* error) noexcept {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK && error) {
    *error = err ? err : sqlite3_errstr(rc);
  }
  sqlite3_free(err);
  return rc == SQLITE_OK;
}

std::string SqliteDB::QueryText(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "sqlite prepare");

  std::string out;
  int         rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const unsigned char* text = sqlite3_column_text(stmt, 0);
    out                       = text ? reinterpret_cast<const char*>(text) : "";
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    ThrowSqliteError(db_, rc, "sqlite step");
  }
  return out;
}

std::string SqliteDB::JournalMode() {
  auto mode = QueryText("PRAGMA journal_mode;");
  std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return mode;
}

void SqliteDB::Configure(const SqliteOptions& options) {
  // wait for locks instead of failing immediately; set first so the
  // journal mode switch below waits out a concurrent opener
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout_ms)), db_, "busy_timeout");

  // distinguish UNIQUE from CHECK / NOT NULL constraint failures
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  auto mode = QueryText("PRAGMA journal_mode=WAL;");
  std::transform(mode.begin(), mode.end(), mode.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (mode != "wal") {
    throw std::runtime_error("sqlite: cannot enable WAL journal mode on " + path_ + " (journal_mode=" + mode + ")");
  }

  // NORMAL is a good tradeoff in WAL mode; use FULL for stronger durability
  Exec("PRAGMA synchronous=" + NormalizeSynchronous(options.synchronous) + ";");

  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace alarmsrv::db::sqlite
