#include <sqlite3.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using alarmsrv::db::ErrorCode;
using alarmsrv::db::model::AlertRuleRecord;
using alarmsrv::db::sqlite::BootstrapSchema;
using alarmsrv::db::sqlite::SqliteDB;
using alarmsrv::db::sqlite::SqliteOptions;
using alarmsrv::db::sqlite::SqlitePool;
using alarmsrv::db::sqlite::SqliteRepository;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "alarmsrv_sqlite_schema_tests" / name;
  std::filesystem::remove_all(dir);
  return dir;
}

SqliteOptions Options(const std::filesystem::path& path) {
  SqliteOptions options;
  options.path            = path.string();
  options.busy_timeout_ms = 1000;
  return options;
}

AlertRuleRecord ValidRecord() {
  AlertRuleRecord record;
  record.channel_id    = 1;
  record.data_type     = "T";
  record.point_id      = 1;
  record.rule_name     = "r";
  record.warning_level = 1;
  record.op            = ">";
  record.value         = 1.0;
  return record;
}

void TestBootstrapCreatesDirectoriesAndIsIdempotent() {
  const auto dir  = FreshDir("bootstrap");
  const auto path = dir / "nested" / "deeper" / "rules.db";

  {
    SqliteDB db(Options(path));
    BootstrapSchema(db);
    BootstrapSchema(db);
    assert(db.JournalMode() == "wal");
    assert(db.QueryText("SELECT COUNT(*) FROM schema_migrations;") == "1");
    assert(db.QueryText("SELECT MAX(version) FROM schema_migrations;") == std::to_string(alarmsrv::db::sqlite::kSchemaVersion));
  }
  assert(std::filesystem::exists(path));

  // a second process start against the same file
  SqliteDB reopened(Options(path));
  BootstrapSchema(reopened);
  assert(reopened.JournalMode() == "wal");
  assert(reopened.QueryText("SELECT COUNT(*) FROM schema_migrations;") == "1");
}

void TestIncompatibleTableRejected() {
  const auto dir  = FreshDir("incompatible");
  const auto path = dir / "rules.db";

  {
    SqliteDB db(Options(path));
    db.Exec("CREATE TABLE alert_rule (id INTEGER PRIMARY KEY, name TEXT);");
  }

  SqliteDB db(Options(path));
  bool     threw = false;
  try {
    BootstrapSchema(db);
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(!db.InTransaction());
}

void TestInvalidSynchronousRejected() {
  auto options        = Options(FreshDir("synchronous") / "rules.db");
  options.synchronous = "SOMETIMES";

  bool threw = false;
  try {
    SqliteDB db(options);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestCheckConstraintsBypassingService() {
  const auto dir  = FreshDir("constraints");
  auto       pool = std::make_shared<SqlitePool>(Options(dir / "rules.db"));
  {
    auto conn = pool->Acquire();
    BootstrapSchema(*conn);
  }
  SqliteRepository repo(pool);

  auto expect = [&](AlertRuleRecord record, ErrorCode code) {
    auto tx     = repo.Begin();
    auto result = repo.InsertRule(*tx, record);
    assert(result.code == code);
  };

  auto bad          = ValidRecord();
  bad.data_type     = "X";
  expect(bad, ErrorCode::ConstraintViolation);

  bad               = ValidRecord();
  bad.warning_level = 7;
  expect(bad, ErrorCode::ConstraintViolation);

  bad    = ValidRecord();
  bad.op = "<>";
  expect(bad, ErrorCode::ConstraintViolation);

  bad           = ValidRecord();
  bad.rule_name = "   ";
  expect(bad, ErrorCode::ConstraintViolation);

  bad            = ValidRecord();
  bad.channel_id = 0;
  expect(bad, ErrorCode::ConstraintViolation);

  bad       = ValidRecord();
  bad.value = std::numeric_limits<double>::infinity();
  expect(bad, ErrorCode::ConstraintViolation);

  bad       = ValidRecord();
  bad.value = std::numeric_limits<double>::quiet_NaN();
  expect(bad, ErrorCode::ConstraintViolation);

  {
    auto tx     = repo.Begin();
    auto record = ValidRecord();
    assert(repo.InsertRule(*tx, record));
    tx->Commit();
  }
  expect(ValidRecord(), ErrorCode::AlreadyExists);

  // raw SQL hits the same wall
  auto conn  = pool->Acquire();
  bool threw = false;
  try {
    conn->Exec("UPDATE alert_rule SET operator='=>';");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRowsSurviveReopen() {
  const auto dir  = FreshDir("reopen");
  const auto path = dir / "rules.db";

  int64_t id = 0;
  {
    auto pool = std::make_shared<SqlitePool>(Options(path));
    {
      auto conn = pool->Acquire();
      BootstrapSchema(*conn);
    }
    SqliteRepository repo(pool);
    auto             tx     = repo.Begin();
    auto             record = ValidRecord();
    record.description      = "persisted";
    assert(repo.InsertRule(*tx, record));
    tx->Commit();
    id = record.id;
  }

  auto pool = std::make_shared<SqlitePool>(Options(path));
  {
    auto conn = pool->Acquire();
    BootstrapSchema(*conn);
  }
  SqliteRepository repo(pool);
  auto             tx     = repo.BeginRead();
  auto             record = repo.GetRule(*tx, id);
  assert(record);
  assert(record->description == "persisted");
  assert(record->enabled);
}

void TestUncommittedWriteRolledBack() {
  const auto dir  = FreshDir("rollback");
  auto       pool = std::make_shared<SqlitePool>(Options(dir / "rules.db"));
  {
    auto conn = pool->Acquire();
    BootstrapSchema(*conn);
  }
  SqliteRepository repo(pool);

  {
    auto tx     = repo.Begin();
    auto record = ValidRecord();
    assert(repo.InsertRule(*tx, record));
  }

  auto tx = repo.BeginRead();
  assert(repo.CountRules(*tx, {}) == 0);
}

} // namespace

int main() {
  TestBootstrapCreatesDirectoriesAndIsIdempotent();
  TestIncompatibleTableRejected();
  TestInvalidSynchronousRejected();
  TestCheckConstraintsBypassingService();
  TestRowsSurviveReopen();
  TestUncommittedWriteRolledBack();

  std::cout << "alarmsrv_unit_sqlite_schema: pass\n";
  return 0;
}
