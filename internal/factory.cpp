#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace alarmsrv::factory {

namespace {

constexpr uint32_t kDefaultBusyTimeoutMs  = 5000;
constexpr uint32_t kDefaultMaxConnections = 8;

db::sqlite::SqliteOptions ToSqliteOptions(const alarmsrv::runtime::config::SqliteConfig& config) {
  db::sqlite::SqliteOptions options;
  options.path            = config.path();
  options.busy_timeout_ms = config.busy_timeout_ms() > 0 ? config.busy_timeout_ms() : kDefaultBusyTimeoutMs;
  options.max_connections = config.max_connections() > 0 ? config.max_connections() : kDefaultMaxConnections;
  if (!config.synchronous().empty()) {
    options.synchronous = config.synchronous();
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const alarmsrv::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto options = ToSqliteOptions(database.sqlite());
    if (options.path.empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }

    auto pool = std::make_shared<db::sqlite::SqlitePool>(options);
    {
      auto conn = pool->Acquire();
      db::sqlite::BootstrapSchema(*conn);
    }

    ALARMSRV_LOG_INFO("Using sqlite rule store", {observability::StringField("path", options.path),
                                                  observability::IntField("busy_timeout_ms", options.busy_timeout_ms),
                                                  observability::IntField("max_connections", options.max_connections),
                                                  observability::StringField("synchronous", options.synchronous)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
  }

  if (!database.has_memory()) {
    throw std::runtime_error("database.sqlite or database.memory is required");
  }

  ALARMSRV_LOG_WARN("Using in-memory rule store; rules are lost on shutdown");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
RuntimeDependencies Build(const alarmsrv::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  deps.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = deps.repository;

  deps.rule_service = std::make_shared<service::RuleService>(ctx);

  return deps;
}

} // namespace alarmsrv::factory
