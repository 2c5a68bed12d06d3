#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace alarmsrv::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::AlertRuleRecord> rules;
    int64_t next_rule_id = 1;
  };

  // held by a write transaction for its whole lifetime
  std::mutex writer_mutex_;

  // guards committed_
  std::mutex mutex_;
  State committed_;
};

}
