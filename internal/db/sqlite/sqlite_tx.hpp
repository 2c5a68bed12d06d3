#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_pool.hpp"

namespace alarmsrv::db::sqlite {

/*
  SQLite transaction wrapper. Owns one pooled connection for its lifetime.

  Write mode uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y lock upgrades later
  Read mode uses BEGIN DEFERRED:
    - reads the last committed WAL snapshot
    - never waits for a writer
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  SqliteTransaction(const std::shared_ptr<SqlitePool>& pool, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
};

}
