#pragma once

#include <cstdint>
#include <string>

namespace alarmsrv::db::model {

/*
  Persistent alert_rule row.

  Enumerated columns are kept in their stored form (code, level, symbol) so
  the storage constraints see exactly what a caller wrote. The service layer
  is responsible for validating them first.
*/

struct AlertRuleRecord {
  int64_t id = 0; // assigned by the store

  int64_t     channel_id = 0;
  std::string data_type;
  int64_t     point_id = 0;
  std::string rule_name;

  int32_t     warning_level = 0;
  std::string op;
  double      value = 0.0;

  bool        enabled = true;
  std::string description;

  // unix epoch milliseconds
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace alarmsrv::db::model
