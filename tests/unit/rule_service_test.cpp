#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/service/rule_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace alarmsrv::v1;
using alarmsrv::service::RuleService;

struct Backend {
  std::string                                              name;
  std::function<std::shared_ptr<alarmsrv::db::Repository>()> make;
};

std::shared_ptr<alarmsrv::db::Repository> MakeSqliteRepository() {
  const auto dir = std::filesystem::temp_directory_path() / "alarmsrv_rule_service_test";
  std::filesystem::remove_all(dir);

  alarmsrv::db::sqlite::SqliteOptions options;
  options.path = (dir / "rules.db").string();

  auto pool = std::make_shared<alarmsrv::db::sqlite::SqlitePool>(options);
  {
    auto conn = pool->Acquire();
    alarmsrv::db::sqlite::BootstrapSchema(*conn);
  }
  return std::make_shared<alarmsrv::db::sqlite::SqliteRepository>(pool);
}

RuleService MakeService(const Backend& backend) {
  alarmsrv::service::ServiceContext ctx;
  ctx.repository = backend.make();
  return RuleService(ctx);
}

RuleFields Fields(int64_t channel_id, const std::string& data_type, int64_t point_id, const std::string& rule_name, int32_t level,
                  const std::string& op, double value) {
  RuleFields fields;
  fields.set_channel_id(channel_id);
  fields.set_data_type(data_type);
  fields.set_point_id(point_id);
  fields.set_rule_name(rule_name);
  fields.set_warning_level(level);
  fields.set_op(op);
  fields.set_value(value);
  return fields;
}

AlertRule Create(RuleService& svc, const RuleFields& fields) {
  CreateRuleRequest req;
  *req.mutable_fields() = fields;
  return svc.Create(req).rule();
}

AlertRule Get(RuleService& svc, int64_t id) {
  GetRuleRequest req;
  req.set_id(id);
  return svc.Get(req).rule();
}

AlertRule SetEnabled(RuleService& svc, int64_t id, bool enabled) {
  SetRuleEnabledRequest req;
  req.set_id(id);
  return enabled ? svc.Enable(req).rule() : svc.Disable(req).rule();
}

uint64_t Total(RuleService& svc) {
  return svc.Stats(GetRuleStatsRequest{}).total();
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

uint64_t Millis(const google::protobuf::Timestamp& ts) {
  return alarmsrv::util::ProtoToMillis(ts);
}

void TestConcreteScenario(const Backend& backend) {
  auto svc = MakeService(backend);

  const auto rule = Create(svc, Fields(1001, "T", 1, "temp-high", 2, ">", 85.0));
  assert(rule.id() == 1);
  assert(rule.enabled());
  assert(rule.description().empty());
  assert(Millis(rule.created_at()) > 0);
  assert(Millis(rule.created_at()) == Millis(rule.updated_at()));

  bool duplicate = false;
  try {
    (void)Create(svc, Fields(1001, "T", 1, "temp-high", 3, "<", 10.0));
  } catch (const alarmsrv::util::DuplicateRule& e) {
    duplicate = true;
    assert(e.Tuple().channel_id == 1001);
    assert(e.Tuple().data_type == "T");
    assert(e.Tuple().point_id == 1);
    assert(e.Tuple().rule_name == "temp-high");
  }
  assert(duplicate);

  ListRulesRequest by_channel;
  by_channel.set_channel_id(1001);
  auto listed = svc.List(by_channel);
  assert(listed.rules_size() == 1);
  assert(listed.total() == 1);
  assert(listed.rules(0).id() == 1);

  const auto disabled = SetEnabled(svc, 1, false);
  assert(!disabled.enabled());

  DeleteRuleRequest del;
  del.set_id(1);
  svc.Delete(del);
  assert(Throws<alarmsrv::util::NotFound>([&] { (void)Get(svc, 1); }));
}

void TestCreateThenGetRoundTrips(const Backend& backend) {
  auto svc = MakeService(backend);

  auto fields = Fields(7, "A", 42, "setpoint-drift", 1, "!=", -3.25);
  fields.set_enabled(false);
  fields.set_description("adjustment watch");

  const auto created = Create(svc, fields);
  const auto fetched = Get(svc, created.id());

  assert(fetched.id() == created.id());
  assert(fetched.channel_id() == 7);
  assert(fetched.data_type() == "A");
  assert(fetched.point_id() == 42);
  assert(fetched.rule_name() == "setpoint-drift");
  assert(fetched.warning_level() == 1);
  assert(fetched.op() == "!=");
  assert(fetched.value() == -3.25);
  assert(!fetched.enabled());
  assert(fetched.description() == "adjustment watch");
  assert(Millis(fetched.created_at()) == Millis(created.created_at()));
}

void TestInvalidInputPersistsNothing(const Backend& backend) {
  auto svc = MakeService(backend);

  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)Create(svc, Fields(1, "X", 1, "r", 1, ">", 1.0)); }));
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)Create(svc, Fields(1, "T", 1, "r", 5, ">", 1.0)); }));
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)Create(svc, Fields(1, "T", 1, "r", 1, "=", 1.0)); }));
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)Create(svc, Fields(1, "T", 1, "", 1, ">", 1.0)); }));
  assert(Total(svc) == 0);

  // malformed input reports the field even when the tuple is taken
  (void)Create(svc, Fields(1, "T", 1, "r", 1, ">", 1.0));
  bool validation = false;
  try {
    (void)Create(svc, Fields(1, "T", 1, "r", 4, ">", 1.0));
  } catch (const alarmsrv::util::ValidationError& e) {
    validation = e.Field() == "warning_level";
  }
  assert(validation);
  assert(Total(svc) == 1);
}

void TestEnableDisableIdempotent(const Backend& backend) {
  auto svc = MakeService(backend);

  const auto rule = Create(svc, Fields(3, "S", 9, "door-open", 3, "==", 1.0));

  const auto first  = SetEnabled(svc, rule.id(), false);
  const auto second = SetEnabled(svc, rule.id(), false);
  assert(!first.enabled() && !second.enabled());
  assert(Millis(first.updated_at()) > Millis(rule.updated_at()));
  assert(Millis(second.updated_at()) > Millis(first.updated_at()));

  const auto third  = SetEnabled(svc, rule.id(), true);
  const auto fourth = SetEnabled(svc, rule.id(), true);
  assert(third.enabled() && fourth.enabled());
  assert(Millis(fourth.updated_at()) > Millis(third.updated_at()));
  assert(Millis(fourth.created_at()) == Millis(rule.created_at()));

  assert(fourth.rule_name() == "door-open");
  assert(fourth.value() == 1.0);

  assert(Throws<alarmsrv::util::NotFound>([&] { (void)SetEnabled(svc, 999, true); }));
}

void TestUpdateReplacesRule(const Backend& backend) {
  auto svc = MakeService(backend);

  auto original = Fields(10, "T", 1, "hot", 2, ">", 80.0);
  original.set_enabled(false);
  original.set_description("first");
  const auto rule  = Create(svc, original);
  const auto other = Create(svc, Fields(10, "T", 1, "cold", 1, "<", 5.0));

  UpdateRuleRequest update;
  update.set_id(rule.id());
  *update.mutable_fields() = Fields(10, "T", 1, "very-hot", 3, ">=", 95.5);
  const auto updated       = svc.Update(update).rule();

  assert(updated.id() == rule.id());
  assert(updated.rule_name() == "very-hot");
  assert(updated.warning_level() == 3);
  assert(updated.op() == ">=");
  assert(updated.value() == 95.5);
  assert(updated.enabled());
  assert(updated.description().empty());
  assert(Millis(updated.created_at()) == Millis(rule.created_at()));
  assert(Millis(updated.updated_at()) > Millis(rule.updated_at()));

  // taking another rule's tuple
  *update.mutable_fields() = Fields(10, "T", 1, "cold", 3, ">", 1.0);
  assert(Throws<alarmsrv::util::DuplicateRule>([&] { (void)svc.Update(update); }));
  assert(Get(svc, rule.id()).rule_name() == "very-hot");
  assert(Get(svc, other.id()).op() == "<");

  update.set_id(12345);
  *update.mutable_fields() = Fields(10, "T", 1, "ghost", 1, ">", 1.0);
  assert(Throws<alarmsrv::util::NotFound>([&] { (void)svc.Update(update); }));

  *update.mutable_fields() = Fields(10, "Q", 1, "ghost", 1, ">", 1.0);
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)svc.Update(update); }));
}

void TestDeleteMissing(const Backend& backend) {
  auto svc = MakeService(backend);

  DeleteRuleRequest del;
  del.set_id(77);
  assert(Throws<alarmsrv::util::NotFound>([&] { svc.Delete(del); }));
}

void TestIdsNeverReused(const Backend& backend) {
  auto svc = MakeService(backend);

  const auto a = Create(svc, Fields(1, "T", 1, "a", 1, ">", 1.0));
  const auto b = Create(svc, Fields(1, "T", 1, "b", 1, ">", 1.0));
  DeleteRuleRequest del;
  del.set_id(b.id());
  svc.Delete(del);
  const auto c = Create(svc, Fields(1, "T", 1, "b", 1, ">", 1.0));
  assert(a.id() < b.id());
  assert(c.id() > b.id());
}

void TestListFiltersAndPaging(const Backend& backend) {
  auto svc = MakeService(backend);

  auto fields = Fields(1, "T", 1, "Boiler-Temp", 3, ">", 90.0);
  fields.set_description("main boiler");
  (void)Create(svc, fields);
  (void)Create(svc, Fields(1, "T", 2, "pressure", 2, ">", 10.0));
  auto disabled = Fields(2, "S", 5, "door", 1, "==", 1.0);
  disabled.set_enabled(false);
  (void)Create(svc, disabled);
  (void)Create(svc, Fields(2, "C", 5, "valve", 2, "!=", 0.0));
  (void)Create(svc, Fields(31, "T", 8, "flow", 1, "<", 3.0));

  assert(svc.List(ListRulesRequest{}).rules_size() == 5);

  ListRulesRequest req;
  req.set_data_type("T");
  assert(svc.List(req).total() == 3);

  req.Clear();
  req.set_enabled(false);
  auto resp = svc.List(req);
  assert(resp.rules_size() == 1 && resp.rules(0).rule_name() == "door");

  req.Clear();
  req.set_warning_level(2);
  assert(svc.List(req).total() == 2);

  req.Clear();
  req.set_channel_id(2);
  req.set_point_id(5);
  assert(svc.List(req).total() == 2);

  // keyword: case-insensitive over name and description, and numeric ids
  req.Clear();
  req.set_keyword("boiler");
  resp = svc.List(req);
  assert(resp.rules_size() == 1 && resp.rules(0).rule_name() == "Boiler-Temp");
  req.set_keyword("31");
  resp = svc.List(req);
  assert(resp.rules_size() == 1 && resp.rules(0).rule_name() == "flow");
  req.set_keyword("%");
  assert(svc.List(req).total() == 0);

  // created range
  req.Clear();
  *req.mutable_created_after() = alarmsrv::util::MillisToProto(0);
  *req.mutable_created_before() = alarmsrv::util::ToProto(alarmsrv::util::Now());
  assert(svc.List(req).total() == 5);
  *req.mutable_created_before() = alarmsrv::util::MillisToProto(1);
  assert(svc.List(req).total() == 0);

  // paging keeps id order and reports the unpaged total
  req.Clear();
  req.set_page_size(2);
  req.set_page(1);
  resp = svc.List(req);
  assert(resp.rules_size() == 2 && resp.total() == 5);
  assert(resp.rules(0).id() < resp.rules(1).id());
  const auto last_of_first = resp.rules(1).id();
  req.set_page(2);
  resp = svc.List(req);
  assert(resp.rules_size() == 2 && resp.rules(0).id() > last_of_first);
  req.set_page(3);
  assert(svc.List(req).rules_size() == 1);
  req.set_page(4);
  assert(svc.List(req).rules_size() == 0);

  req.set_page_size(101);
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)svc.List(req); }));
  req.Clear();
  req.set_data_type("Z");
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)svc.List(req); }));
  req.Clear();
  req.set_warning_level(0);
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)svc.List(req); }));
}

std::string RejectedField(RuleService& svc, const ListRulesRequest& req) {
  try {
    (void)svc.List(req);
  } catch (const alarmsrv::util::ValidationError& ex) {
    return ex.Field();
  }
  return "";
}

void TestListRejectsOutOfRangeTimestamps(const Backend& backend) {
  auto svc = MakeService(backend);
  (void)Create(svc, Fields(1, "T", 1, "a", 1, ">", 1.0));

  ListRulesRequest req;
  req.mutable_created_after()->set_seconds(0);
  req.mutable_created_after()->set_nanos(-1);
  assert(RejectedField(svc, req) == "created_after");

  req.mutable_created_after()->set_nanos(1000000000);
  assert(RejectedField(svc, req) == "created_after");

  req.Clear();
  req.mutable_created_before()->set_seconds(int64_t{1} << 62);
  assert(RejectedField(svc, req) == "created_before");

  req.mutable_created_before()->set_seconds(-62135596801LL);
  assert(RejectedField(svc, req) == "created_before");

  // the last representable instant still matches everything
  req.mutable_created_before()->set_seconds(253402300799LL);
  req.mutable_created_before()->set_nanos(999999999);
  assert(svc.List(req).total() == 1);
}

void TestListForPointOrdersBySeverity(const Backend& backend) {
  auto svc = MakeService(backend);

  const auto low  = Create(svc, Fields(4, "T", 11, "warm", 1, ">", 40.0));
  const auto high = Create(svc, Fields(4, "T", 11, "burning", 3, ">", 120.0));
  const auto mid1 = Create(svc, Fields(4, "T", 11, "hot", 2, ">", 70.0));
  const auto mid2 = Create(svc, Fields(4, "T", 11, "hotter", 2, ">", 80.0));
  auto       off  = Fields(4, "T", 11, "muted", 3, ">", 60.0);
  off.set_enabled(false);
  (void)Create(svc, off);
  (void)Create(svc, Fields(4, "S", 11, "other-type", 3, "==", 1.0));

  ListPointRulesRequest req;
  req.set_channel_id(4);
  req.set_data_type("T");
  req.set_point_id(11);
  const auto resp = svc.ListForPoint(req);

  assert(resp.rules_size() == 4);
  assert(resp.rules(0).id() == high.id());
  assert(resp.rules(1).id() == mid1.id());
  assert(resp.rules(2).id() == mid2.id());
  assert(resp.rules(3).id() == low.id());

  req.set_data_type("W");
  assert(Throws<alarmsrv::util::ValidationError>([&] { (void)svc.ListForPoint(req); }));
}

void TestStats(const Backend& backend) {
  auto svc = MakeService(backend);

  (void)Create(svc, Fields(1, "T", 1, "a", 1, ">", 1.0));
  const auto b = Create(svc, Fields(1, "T", 1, "b", 1, ">", 1.0));
  (void)SetEnabled(svc, b.id(), false);

  const auto stats = svc.Stats(GetRuleStatsRequest{});
  assert(stats.total() == 2);
  assert(stats.enabled() == 1);
}

} // namespace

int main() {
  std::vector<Backend> backends = {
      {"memory", [] { return std::make_shared<alarmsrv::db::memory::MemoryRepository>(); }},
      {"sqlite", MakeSqliteRepository},
  };

  for (const auto& backend : backends) {
    TestConcreteScenario(backend);
    TestCreateThenGetRoundTrips(backend);
    TestInvalidInputPersistsNothing(backend);
    TestEnableDisableIdempotent(backend);
    TestUpdateReplacesRule(backend);
    TestDeleteMissing(backend);
    TestIdsNeverReused(backend);
    TestListFiltersAndPaging(backend);
    TestListRejectsOutOfRangeTimestamps(backend);
    TestListForPointOrdersBySeverity(backend);
    TestStats(backend);
    std::cout << "  " << backend.name << ": ok\n";
  }

  std::cout << "alarmsrv_unit_rule_service: pass\n";
  return 0;
}
