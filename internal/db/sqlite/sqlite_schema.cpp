#include "sqlite_schema.hpp"

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace alarmsrv::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& statement) override {
    db_.Exec(statement);
  }

  int64_t CurrentVersion() override {
    const auto version = db_.QueryText("SELECT COALESCE(MAX(version),0) FROM schema_migrations;");
    return version.empty() ? 0 : std::stoll(version);
  }

  void RecordVersion(int64_t version) override {
    db_.Exec("INSERT OR IGNORE INTO schema_migrations(version,applied_at_ms) VALUES(" + std::to_string(version) + "," +
             std::to_string(util::ToUnixMillis(util::Now())) + ");");
  }

 private:
  SqliteDB& db_;
};

std::vector<sql::MigrationStep> MigrationSteps() {
  sql::MigrationStep v1{sql::CREATE_RULE_TABLE};
  for (const char* index : sql::CREATE_RULE_INDEXES) {
    v1.emplace_back(index);
  }
  return {v1};
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec(sql::CREATE_MIGRATIONS_TABLE);

    SqliteMigrationExecutor executor(db);
    const int               applied = sql::RunMigrations(executor, MigrationSteps());

    // fail fast if an incompatible table already sits at this path
    db.Exec(std::string("SELECT ") + sql::RULE_COLUMNS + " FROM alert_rule LIMIT 1;");

    db.Exec("COMMIT;");

    if (applied > 0) {
      ALARMSRV_LOG_INFO("sqlite schema migrated", {observability::StringField("path", db.Path()), observability::IntField("applied", applied),
                                                   observability::IntField("version", kSchemaVersion)});
    }
  } catch (...) {
    std::string error;
    if (!db.TryExec("ROLLBACK;", &error)) {
      ALARMSRV_LOG_WARN("sqlite schema rollback failed", {observability::StringField("error", error)});
    }
    throw;
  }
}

} // namespace alarmsrv::db::sqlite
