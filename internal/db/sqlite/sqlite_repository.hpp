#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace alarmsrv::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertRule(Transaction&, model::AlertRuleRecord&) override;
  Result UpdateRule(Transaction&, model::AlertRuleRecord&) override;
  Result SetRuleEnabled(Transaction&, int64_t id, bool enabled) override;
  Result DeleteRule(Transaction&, int64_t id) override;
  std::optional<model::AlertRuleRecord> GetRule(Transaction&, int64_t id) override;
  std::vector<model::AlertRuleRecord> ListRules(Transaction&, const model::RuleFilter&) override;
  uint64_t CountRules(Transaction&, const model::RuleFilter&) override;

private:
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
