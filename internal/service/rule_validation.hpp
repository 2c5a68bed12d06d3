#pragma once

#include "alarmsrv/v1.hpp"
#include "internal/db/model/alert_rule_record.hpp"

namespace alarmsrv::service {

/*
  Checks client-supplied rule content and converts it to a storage record.

  Fields are checked in a fixed order (channel_id, data_type, point_id,
  rule_name, warning_level, op, value); the first failure throws
  util::ValidationError naming that field. Nothing here touches storage.

  Absent enabled becomes true, absent description becomes empty.
*/
db::model::AlertRuleRecord ValidateRuleFields(const alarmsrv::v1::RuleFields& fields);

}
