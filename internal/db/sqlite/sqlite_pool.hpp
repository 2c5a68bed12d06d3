#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "sqlite_db.hpp"

namespace alarmsrv::db::sqlite {

/*
  SqlitePool

  Connection pool used by SqliteRepository; the process-wide handle on
  the backing file.

  Design notes:
  -------------
  - Each transaction gets its own connection. A SQLite transaction is
    per-connection, so sharing one handle between concurrent
    transactions is not possible.
  - WAL lets every pooled reader run against the last committed
    snapshot while one writer holds the write lock.
  - The first connection is opened eagerly so an unusable path fails
    at startup rather than on the first request.
  - Acquire() waits at most busy_timeout_ms for a free connection and
    then throws util::StorageUnavailable.

  Lifetime:
    Repository owns shared_ptr<SqlitePool>
    Transaction acquires shared_ptr<SqliteDB>
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(SqliteOptions options);

  SqlitePool(const SqlitePool&)            = delete;
  SqlitePool& operator=(const SqlitePool&) = delete;

  // Acquire a ready-to-use connection; returned to the pool on release
  std::shared_ptr<SqliteDB> Acquire();

  const SqliteOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  SqliteOptions options_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace alarmsrv::db::sqlite
