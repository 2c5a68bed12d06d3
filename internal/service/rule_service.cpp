#include "rule_service.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/model/rule_types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rule_validation.hpp"

namespace alarmsrv::service {

using namespace alarmsrv::v1;

namespace {

constexpr uint32_t kMaxPageSize = 100;

util::RuleTuple TupleOf(const db::model::AlertRuleRecord& record) {
  return {record.channel_id, record.data_type, record.point_id, record.rule_name};
}

// Maps a failed storage result onto the service error taxonomy.
void ThrowIfDbError(const db::Result& result, const std::string& prefix, const db::model::AlertRuleRecord* record = nullptr) {
  if (result) {
    return;
  }

  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      if (record) throw util::DuplicateRule(TupleOf(*record));
      throw util::ConstraintViolation(prefix + ": " + result.message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(prefix + ": " + result.message);
    case db::ErrorCode::ConstraintViolation:
      throw util::ConstraintViolation(prefix + ": " + result.message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::Corruption:
      throw util::StorageUnavailable(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.message);
  }
}

bool IsClientError(const std::exception& ex) {
  return dynamic_cast<const util::ValidationError*>(&ex) || dynamic_cast<const util::DuplicateRule*>(&ex) ||
         dynamic_cast<const util::NotFound*>(&ex);
}

template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    if (IsClientError(ex)) {
      ALARMSRV_LOG_WARN("Request rejected", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    } else {
      ALARMSRV_LOG_ERROR("Request failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                            observability::IntField("elapsed_ms", elapsed_ms())});
    }
    throw;
  }
}

db::model::RuleFilter ToFilter(const ListRulesRequest& req) {
  db::model::RuleFilter filter;

  if (req.has_channel_id()) {
    if (req.channel_id() <= 0) throw util::ValidationError("channel_id", "must be positive");
    filter.channel_id = req.channel_id();
  }
  if (req.has_data_type()) {
    if (!model::ParseDataType(req.data_type())) throw util::ValidationError("data_type", "must be one of T, S, C, A");
    filter.data_type = req.data_type();
  }
  if (req.has_point_id()) {
    if (req.point_id() <= 0) throw util::ValidationError("point_id", "must be positive");
    filter.point_id = req.point_id();
  }
  if (req.has_warning_level()) {
    if (!model::ParseWarningLevel(req.warning_level())) throw util::ValidationError("warning_level", "must be 1, 2 or 3");
    filter.warning_level = req.warning_level();
  }
  if (req.has_enabled()) {
    filter.enabled = req.enabled();
  }
  filter.keyword = req.keyword();

  if (req.has_created_after()) {
    if (!util::IsValidTimestamp(req.created_after())) throw util::ValidationError("created_after", "timestamp out of range");
    filter.created_from_ms = util::ProtoToMillis(req.created_after());
  }
  if (req.has_created_before()) {
    if (!util::IsValidTimestamp(req.created_before())) throw util::ValidationError("created_before", "timestamp out of range");
    filter.created_to_ms = util::ProtoToMillis(req.created_before());
  }
  if (filter.created_from_ms && filter.created_to_ms && *filter.created_from_ms > *filter.created_to_ms) {
    throw util::ValidationError("created_after", "must not be later than created_before");
  }

  if (req.page_size() > kMaxPageSize) {
    throw util::ValidationError("page_size", "must be at most " + std::to_string(kMaxPageSize));
  }
  if (req.page_size() > 0) {
    const uint64_t page = req.page() == 0 ? 1 : req.page();
    filter.limit        = req.page_size();
    filter.offset       = (page - 1) * req.page_size();
  }
  return filter;
}

} // namespace

AlertRule ToProto(const db::model::AlertRuleRecord& record) {
  AlertRule rule;
  rule.set_id(record.id);
  rule.set_channel_id(record.channel_id);
  rule.set_data_type(record.data_type);
  rule.set_point_id(record.point_id);
  rule.set_rule_name(record.rule_name);
  rule.set_warning_level(record.warning_level);
  rule.set_op(record.op);
  rule.set_value(record.value);
  rule.set_enabled(record.enabled);
  rule.set_description(record.description);
  *rule.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *rule.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return rule;
}

RuleService::RuleService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateRuleResponse RuleService::Create(const CreateRuleRequest& req) {
  return ObserveCall("RuleService.Create", [&] {
    auto record = ValidateRuleFields(req.fields());

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->InsertRule(*tx, record), "create rule", &record);
    tx->Commit();

    ALARMSRV_LOG_INFO("Rule created", {observability::IntField("id", record.id), observability::IntField("channel_id", record.channel_id),
                                       observability::StringField("data_type", model::ToString(*model::ParseDataType(record.data_type))),
                                       observability::IntField("point_id", record.point_id),
                                       observability::StringField("rule_name", record.rule_name),
                                       observability::StringField("severity", model::ToString(*model::ParseWarningLevel(record.warning_level)))});

    CreateRuleResponse resp;
    *resp.mutable_rule() = ToProto(record);
    return resp;
  });
}

GetRuleResponse RuleService::Get(const GetRuleRequest& req) {
  return ObserveCall("RuleService.Get", [&] {
    auto tx     = ctx_.repository->BeginRead();
    auto record = ctx_.repository->GetRule(*tx, req.id());
    tx->Commit();

    if (!record) {
      throw util::NotFound("alert rule " + std::to_string(req.id()) + " not found");
    }

    GetRuleResponse resp;
    *resp.mutable_rule() = ToProto(*record);
    return resp;
  });
}

ListRulesResponse RuleService::List(const ListRulesRequest& req) {
  return ObserveCall("RuleService.List", [&] {
    const auto filter = ToFilter(req);

    auto tx      = ctx_.repository->BeginRead();
    auto records = ctx_.repository->ListRules(*tx, filter);
    auto total   = ctx_.repository->CountRules(*tx, filter);
    tx->Commit();

    ALARMSRV_LOG_DEBUG("Rules listed", {observability::IntField("returned", static_cast<int64_t>(records.size())),
                                        observability::IntField("total", static_cast<int64_t>(total))});

    ListRulesResponse resp;
    resp.set_total(total);
    for (const auto& record : records) {
      *resp.add_rules() = ToProto(record);
    }
    return resp;
  });
}

ListRulesResponse RuleService::ListForPoint(const ListPointRulesRequest& req) {
  return ObserveCall("RuleService.ListForPoint", [&] {
    if (req.channel_id() <= 0) throw util::ValidationError("channel_id", "must be positive");
    if (!model::ParseDataType(req.data_type())) throw util::ValidationError("data_type", "must be one of T, S, C, A");
    if (req.point_id() <= 0) throw util::ValidationError("point_id", "must be positive");

    db::model::RuleFilter filter;
    filter.channel_id = req.channel_id();
    filter.data_type  = req.data_type();
    filter.point_id   = req.point_id();
    filter.enabled    = true;

    auto tx      = ctx_.repository->BeginRead();
    auto records = ctx_.repository->ListRules(*tx, filter);
    tx->Commit();

    std::stable_sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.warning_level > b.warning_level; });

    ListRulesResponse resp;
    resp.set_total(records.size());
    for (const auto& record : records) {
      *resp.add_rules() = ToProto(record);
    }
    return resp;
  });
}

UpdateRuleResponse RuleService::Update(const UpdateRuleRequest& req) {
  return ObserveCall("RuleService.Update", [&] {
    auto record = ValidateRuleFields(req.fields());
    record.id   = req.id();

    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->UpdateRule(*tx, record), "update rule", &record);
    tx->Commit();

    ALARMSRV_LOG_INFO("Rule updated", {observability::IntField("id", record.id)});

    UpdateRuleResponse resp;
    *resp.mutable_rule() = ToProto(record);
    return resp;
  });
}

void RuleService::Delete(const DeleteRuleRequest& req) {
  ObserveCall("RuleService.Delete", [&] {
    auto tx = ctx_.repository->Begin();
    ThrowIfDbError(ctx_.repository->DeleteRule(*tx, req.id()), "delete rule");
    tx->Commit();

    ALARMSRV_LOG_INFO("Rule deleted", {observability::IntField("id", req.id())});
  });
}

SetRuleEnabledResponse RuleService::Enable(const SetRuleEnabledRequest& req) {
  return ObserveCall("RuleService.Enable", [&] { return SetEnabled(req.id(), true); });
}

SetRuleEnabledResponse RuleService::Disable(const SetRuleEnabledRequest& req) {
  return ObserveCall("RuleService.Disable", [&] { return SetEnabled(req.id(), false); });
}

SetRuleEnabledResponse RuleService::SetEnabled(int64_t id, bool enabled) {
  auto tx = ctx_.repository->Begin();
  ThrowIfDbError(ctx_.repository->SetRuleEnabled(*tx, id, enabled), enabled ? "enable rule" : "disable rule");
  auto record = ctx_.repository->GetRule(*tx, id);
  tx->Commit();

  if (!record) {
    throw std::runtime_error("alert rule " + std::to_string(id) + " vanished inside its transaction");
  }

  ALARMSRV_LOG_INFO(enabled ? "Rule enabled" : "Rule disabled", {observability::IntField("id", id)});

  SetRuleEnabledResponse resp;
  *resp.mutable_rule() = ToProto(*record);
  return resp;
}

GetRuleStatsResponse RuleService::Stats(const GetRuleStatsRequest&) {
  return ObserveCall("RuleService.Stats", [&] {
    db::model::RuleFilter enabled_only;
    enabled_only.enabled = true;

    auto tx      = ctx_.repository->BeginRead();
    auto total   = ctx_.repository->CountRules(*tx, {});
    auto enabled = ctx_.repository->CountRules(*tx, enabled_only);
    tx->Commit();

    GetRuleStatsResponse resp;
    resp.set_total(total);
    resp.set_enabled(enabled);
    return resp;
  });
}

} // namespace alarmsrv::service
