#include "sqlite_tx.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace alarmsrv::db::sqlite {

SqliteTransaction::SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, Mode mode) : db_(pool->Acquire()) {
  db_->Exec(mode == Mode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    std::string error;
    if (!db_->TryExec("ROLLBACK;", &error)) {
      ALARMSRV_LOG_WARN("sqlite rollback failed", {observability::StringField("error", error)});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace alarmsrv::db::sqlite
