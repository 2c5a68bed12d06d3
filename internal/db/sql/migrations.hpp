#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace alarmsrv::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; RunMigrations decides which
  steps still need to run.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 for a fresh store.
  virtual int64_t CurrentVersion() = 0;

  virtual void RecordVersion(int64_t version) = 0;
};

/*
  A migration step is a list of statements applied together.
  Step i (0-based) brings the schema to version i + 1.
*/
using MigrationStep = std::vector<std::string>;

// Returns the number of steps applied. Safe to call on every start.
int RunMigrations(MigrationExecutor& executor, const std::vector<MigrationStep>& ordered_steps);

} // namespace alarmsrv::db::sql
