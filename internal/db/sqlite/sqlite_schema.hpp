#pragma once

#include <cstdint>

#include "sqlite_db.hpp"

namespace alarmsrv::db::sqlite {

inline constexpr int64_t kSchemaVersion = 1;

/*
  Creates the alert_rule table, its indexes and the migration ledger.

  Idempotent: safe on every process start. Runs inside one write
  transaction so a concurrent starter never sees a half-built schema.
  Throws on failure; the store is unusable without its schema.
*/
void BootstrapSchema(SqliteDB& db);

} // namespace alarmsrv::db::sqlite
