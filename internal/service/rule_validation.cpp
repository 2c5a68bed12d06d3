#include "rule_validation.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

#include "internal/model/rule_types.hpp"
#include "internal/util/errors.hpp"

namespace alarmsrv::service {

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

db::model::AlertRuleRecord ValidateRuleFields(const alarmsrv::v1::RuleFields& fields) {
  using util::ValidationError;

  if (!fields.has_channel_id()) throw ValidationError("channel_id", "required");
  if (fields.channel_id() <= 0) throw ValidationError("channel_id", "must be positive, got " + std::to_string(fields.channel_id()));

  const auto data_type = model::ParseDataType(fields.data_type());
  if (!data_type) {
    throw ValidationError("data_type", "must be one of T, S, C, A, got '" + fields.data_type() + "'");
  }

  if (!fields.has_point_id()) throw ValidationError("point_id", "required");
  if (fields.point_id() <= 0) throw ValidationError("point_id", "must be positive, got " + std::to_string(fields.point_id()));

  if (IsBlank(fields.rule_name())) throw ValidationError("rule_name", "must not be empty");

  if (!fields.has_warning_level()) throw ValidationError("warning_level", "required");
  const auto level = model::ParseWarningLevel(fields.warning_level());
  if (!level) {
    throw ValidationError("warning_level", "must be 1, 2 or 3, got " + std::to_string(fields.warning_level()));
  }

  const auto op = model::ParseOperator(fields.op());
  if (!op) {
    throw ValidationError("op", "must be one of >, <, >=, <=, ==, !=, got '" + fields.op() + "'");
  }

  if (!fields.has_value()) throw ValidationError("value", "required");
  if (!std::isfinite(fields.value())) throw ValidationError("value", "must be finite");

  db::model::AlertRuleRecord record;
  record.channel_id    = fields.channel_id();
  record.data_type     = std::string(model::ToCode(*data_type));
  record.point_id      = fields.point_id();
  record.rule_name     = fields.rule_name();
  record.warning_level = static_cast<int32_t>(*level);
  record.op            = std::string(model::ToSymbol(*op));
  record.value         = fields.value();
  record.enabled       = fields.has_enabled() ? fields.enabled() : true;
  record.description   = fields.description();
  return record;
}

} // namespace alarmsrv::service
