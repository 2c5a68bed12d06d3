#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/alert_rule_record.hpp"
#include "internal/db/model/rule_filter.hpp"

namespace alarmsrv::db {

/*
  Repository abstraction over the alert_rule table.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction (Begin())
  - Reads inside a transaction see its writes
  - The rule tuple (channel_id, data_type, point_id, rule_name) is unique;
    a collision is reported as ErrorCode::AlreadyExists
  - data_type / warning_level / op membership and NOT NULL columns are
    enforced by the store itself (ErrorCode::ConstraintViolation), even
    for callers that skip service validation
  - updated_at strictly increases on every successful mutation of a row

  Write methods report failures through Result. Read methods throw
  util::StorageUnavailable when the backend cannot serve them.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Alert rules
  // ---------------------------------------------------------------------

  // Assigns id, created_at_ms and updated_at_ms on success.
  virtual Result InsertRule(Transaction&, model::AlertRuleRecord&) = 0;

  // Replaces every mutable column of record.id; reloads the record.
  virtual Result UpdateRule(Transaction&, model::AlertRuleRecord&) = 0;

  virtual Result SetRuleEnabled(Transaction&, int64_t id, bool enabled) = 0;

  virtual Result DeleteRule(Transaction&, int64_t id) = 0;

  virtual std::optional<model::AlertRuleRecord> GetRule(Transaction&, int64_t id) = 0;

  // Ordered by id ascending.
  virtual std::vector<model::AlertRuleRecord> ListRules(Transaction&, const model::RuleFilter&) = 0;

  // Ignores filter.limit / filter.offset.
  virtual uint64_t CountRules(Transaction&, const model::RuleFilter&) = 0;
};

} // namespace alarmsrv::db
