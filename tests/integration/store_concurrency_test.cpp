#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/service/rule_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace alarmsrv::v1;
using alarmsrv::db::Repository;
using alarmsrv::db::model::AlertRuleRecord;

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
};

std::shared_ptr<Repository> MakeSqlite() {
  const auto dir = std::filesystem::temp_directory_path() / "alarmsrv_concurrency";
  std::filesystem::remove_all(dir);

  alarmsrv::db::sqlite::SqliteOptions options;
  options.path            = (dir / "rules.db").string();
  options.busy_timeout_ms = 10000;
  options.max_connections = 16;

  auto pool = std::make_shared<alarmsrv::db::sqlite::SqlitePool>(options);
  {
    auto conn = pool->Acquire();
    alarmsrv::db::sqlite::BootstrapSchema(*conn);
  }
  return std::make_shared<alarmsrv::db::sqlite::SqliteRepository>(pool);
}

CreateRuleRequest SameTupleRequest(int attempt) {
  CreateRuleRequest req;
  auto*             fields = req.mutable_fields();
  fields->set_channel_id(1001);
  fields->set_data_type("T");
  fields->set_point_id(1);
  fields->set_rule_name("temp-high");
  fields->set_warning_level(1 + attempt % 3);
  fields->set_op(">");
  fields->set_value(80.0 + attempt);
  return req;
}

void VerifyConcurrentCreatorsOfOneTuple(const BackendFactory& backend) {
  alarmsrv::service::ServiceContext ctx;
  ctx.repository = backend.make_repository();
  alarmsrv::service::RuleService svc(ctx);

  constexpr int kWriters = 8;

  std::atomic<int>  successes{0};
  std::atomic<int>  duplicates{0};
  std::atomic<int>  other_errors{0};
  std::atomic<bool> go{false};

  std::vector<std::thread> threads;
  for (int i = 0; i < kWriters; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load()) std::this_thread::yield();
      try {
        (void)svc.Create(SameTupleRequest(i));
        successes.fetch_add(1);
      } catch (const alarmsrv::util::DuplicateRule&) {
        duplicates.fetch_add(1);
      } catch (const std::exception& ex) {
        std::cerr << backend.name << ": unexpected error: " << ex.what() << "\n";
        other_errors.fetch_add(1);
      }
    });
  }
  go.store(true);
  for (auto& t : threads) t.join();

  assert(successes.load() == 1);
  assert(duplicates.load() == kWriters - 1);
  assert(other_errors.load() == 0);

  const auto stats = svc.Stats(GetRuleStatsRequest{});
  assert(stats.total() == 1);
}

void VerifyReaderNotBlockedByOpenWriter(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  AlertRuleRecord seed;
  seed.channel_id    = 9;
  seed.data_type     = "S";
  seed.point_id      = 3;
  seed.rule_name     = "seed";
  seed.warning_level = 1;
  seed.op            = "==";
  seed.value         = 1.0;
  {
    auto tx = repo->Begin();
    assert(repo->InsertRule(*tx, seed));
    tx->Commit();
  }

  auto writer = repo->Begin();
  assert(repo->SetRuleEnabled(*writer, seed.id, false));
  AlertRuleRecord pending = seed;
  pending.rule_name       = "pending";
  assert(repo->InsertRule(*writer, pending));

  // reader on another thread must finish while the writer is still open
  auto reader = std::async(std::launch::async, [&] {
    auto tx     = repo->BeginRead();
    auto rules  = repo->ListRules(*tx, {});
    tx->Commit();
    return rules;
  });
  assert(reader.wait_for(std::chrono::seconds(5)) == std::future_status::ready);

  const auto snapshot = reader.get();
  assert(snapshot.size() == 1);
  assert(snapshot[0].rule_name == "seed");
  assert(snapshot[0].enabled);

  writer->Commit();

  auto tx = repo->BeginRead();
  assert(repo->CountRules(*tx, {}) == 2);
  assert(!repo->GetRule(*tx, seed.id)->enabled);
}

void VerifyWritersSerialized(const BackendFactory& backend) {
  auto repo = backend.make_repository();

  AlertRuleRecord first;
  first.channel_id    = 1;
  first.data_type     = "C";
  first.point_id      = 1;
  first.rule_name     = "first";
  first.warning_level = 2;
  first.op            = "<";
  first.value         = 0.5;

  auto writer = repo->Begin();
  assert(repo->InsertRule(*writer, first));

  std::atomic<bool> second_started{false};
  auto              second = std::async(std::launch::async, [&] {
    second_started.store(true);
    auto            tx   = repo->Begin();
    AlertRuleRecord next = first;
    next.rule_name       = "second";
    auto result          = repo->InsertRule(*tx, next);
    tx->Commit();
    return std::make_pair(static_cast<bool>(result), next.id);
  });

  while (!second_started.load()) std::this_thread::yield();
  assert(second.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout);

  writer->Commit();
  const auto [ok, second_id] = second.get();
  assert(ok);
  assert(second_id > first.id);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends = {
      {"memory", [] { return std::make_shared<alarmsrv::db::memory::MemoryRepository>(); }},
      {"sqlite", MakeSqlite},
  };

  for (const auto& backend : backends) {
    VerifyConcurrentCreatorsOfOneTuple(backend);
    VerifyReaderNotBlockedByOpenWriter(backend);
    VerifyWritersSerialized(backend);
    std::cout << "  " << backend.name << ": ok\n";
  }

  std::cout << "alarmsrv_integration_store_concurrency: pass\n";
  return 0;
}
