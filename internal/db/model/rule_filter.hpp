#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace alarmsrv::db::model {

/*
  Row selection for ListRules / CountRules.

  Unset members do not constrain the result. limit == 0 means unbounded.
*/

struct RuleFilter {
  std::optional<int64_t>     channel_id;
  std::optional<std::string> data_type;
  std::optional<int64_t>     point_id;
  std::optional<int32_t>     warning_level;
  std::optional<bool>        enabled;

  // substring of rule_name, description, channel_id or point_id
  std::string keyword;

  // inclusive bounds on created_at
  std::optional<uint64_t> created_from_ms;
  std::optional<uint64_t> created_to_ms;

  uint64_t limit  = 0;
  uint64_t offset = 0;
};

} // namespace alarmsrv::db::model
