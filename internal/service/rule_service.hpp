#pragma once

#include <cstdint>

#include "alarmsrv/v1.hpp"
#include "internal/db/model/alert_rule_record.hpp"
#include "service_context.hpp"

namespace alarmsrv::service {

/*
  CRUD and query operations over alert rules.

  Failures are reported as exceptions from internal/util/errors.hpp:
    ValidationError     malformed input, nothing persisted
    DuplicateRule       rule tuple already taken
    NotFound            unknown id
    ConstraintViolation storage rejected the row
    StorageUnavailable  busy, I/O or corruption
*/
class RuleService {
public:
  explicit RuleService(ServiceContext ctx);

  alarmsrv::v1::CreateRuleResponse
  Create(const alarmsrv::v1::CreateRuleRequest& req);

  alarmsrv::v1::GetRuleResponse
  Get(const alarmsrv::v1::GetRuleRequest& req);

  alarmsrv::v1::ListRulesResponse
  List(const alarmsrv::v1::ListRulesRequest& req);

  // Enabled rules watching one point, highest warning level first.
  alarmsrv::v1::ListRulesResponse
  ListForPoint(const alarmsrv::v1::ListPointRulesRequest& req);

  // Full replace of every mutable field.
  alarmsrv::v1::UpdateRuleResponse
  Update(const alarmsrv::v1::UpdateRuleRequest& req);

  void Delete(const alarmsrv::v1::DeleteRuleRequest& req);

  alarmsrv::v1::SetRuleEnabledResponse
  Enable(const alarmsrv::v1::SetRuleEnabledRequest& req);

  alarmsrv::v1::SetRuleEnabledResponse
  Disable(const alarmsrv::v1::SetRuleEnabledRequest& req);

  alarmsrv::v1::GetRuleStatsResponse
  Stats(const alarmsrv::v1::GetRuleStatsRequest& req);

private:
  alarmsrv::v1::SetRuleEnabledResponse SetEnabled(int64_t id, bool enabled);

  ServiceContext ctx_;
};

alarmsrv::v1::AlertRule ToProto(const db::model::AlertRuleRecord& record);

}
