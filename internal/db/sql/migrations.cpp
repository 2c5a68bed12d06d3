#include "migrations.hpp"

namespace alarmsrv::db::sql {

int RunMigrations(MigrationExecutor& executor, const std::vector<MigrationStep>& ordered_steps) {
  const int64_t current = executor.CurrentVersion();

  int applied = 0;
  for (std::size_t i = 0; i < ordered_steps.size(); ++i) {
    const auto version = static_cast<int64_t>(i) + 1;
    if (version <= current) {
      continue;
    }
    for (const auto& statement : ordered_steps[i]) {
      executor.ExecuteSQL(statement);
    }
    executor.RecordVersion(version);
    ++applied;
  }
  return applied;
}

} // namespace alarmsrv::db::sql
