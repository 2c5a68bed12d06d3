#include "sqlite_pool.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace alarmsrv::db::sqlite {

SqlitePool::SqlitePool(SqliteOptions options) : options_(std::move(options)) {
  if (options_.max_connections == 0) {
    options_.max_connections = 1;
  }

  idle_.push_back(std::make_unique<SqliteDB>(options_));
  live_connections_ = 1;
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.busy_timeout_ms);

  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < options_.max_connections) {
      ++live_connections_;
      lock.unlock();

      try {
        return Wrap(new SqliteDB(options_));
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < options_.max_connections;
    });
    if (!ready) {
      throw util::StorageUnavailable("sqlite: no free connection within " + std::to_string(options_.busy_timeout_ms) + "ms");
    }
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  // a connection stuck inside a transaction cannot be reused
  if (conn->InTransaction()) {
    ALARMSRV_LOG_WARN("Discarding sqlite connection with open transaction", {observability::StringField("path", conn->Path())});
    delete conn;
    {
      std::lock_guard lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    return;
  }

  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace alarmsrv::db::sqlite
