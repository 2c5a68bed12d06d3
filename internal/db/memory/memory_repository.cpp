#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <string>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace alarmsrv::db::memory {

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// Same checks the sqlite table declares.
Result CheckConstraints(const model::AlertRuleRecord& r) {
  static const char* kDataTypes[] = {"T", "S", "C", "A"};
  static const char* kOperators[] = {">", "<", ">=", "<=", "==", "!="};

  if (r.channel_id <= 0) return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: channel_id");
  if (r.point_id <= 0) return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: point_id");
  if (std::none_of(std::begin(kDataTypes), std::end(kDataTypes), [&](const char* t) { return r.data_type == t; }))
    return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: data_type");
  if (IsBlank(r.rule_name)) return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: rule_name");
  if (r.warning_level < 1 || r.warning_level > 3)
    return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: warning_level");
  if (std::none_of(std::begin(kOperators), std::end(kOperators), [&](const char* o) { return r.op == o; }))
    return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: operator");
  if (!std::isfinite(r.value)) return Result::Err(ErrorCode::ConstraintViolation, "CHECK constraint failed: value");
  return Result::Ok();
}

bool SameTuple(const model::AlertRuleRecord& a, const model::AlertRuleRecord& b) {
  return a.channel_id == b.channel_id && a.data_type == b.data_type && a.point_id == b.point_id && a.rule_name == b.rule_name;
}

// ASCII case-insensitive, like sqlite LIKE
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](unsigned char a, unsigned char b) {
    return std::tolower(a) == std::tolower(b);
  });
  return it != haystack.end();
}

bool Matches(const model::AlertRuleRecord& r, const model::RuleFilter& f) {
  if (f.channel_id && r.channel_id != *f.channel_id) return false;
  if (f.data_type && r.data_type != *f.data_type) return false;
  if (f.point_id && r.point_id != *f.point_id) return false;
  if (f.warning_level && r.warning_level != *f.warning_level) return false;
  if (f.enabled && r.enabled != *f.enabled) return false;
  if (f.created_from_ms && r.created_at_ms < *f.created_from_ms) return false;
  if (f.created_to_ms && r.created_at_ms > *f.created_to_ms) return false;
  if (!f.keyword.empty()) {
    if (!ContainsIgnoreCase(r.rule_name, f.keyword) && !ContainsIgnoreCase(r.description, f.keyword) &&
        !ContainsIgnoreCase(std::to_string(r.channel_id), f.keyword) && !ContainsIgnoreCase(std::to_string(r.point_id), f.keyword))
      return false;
  }
  return true;
}

Result NotFound(int64_t id) {
  return Result::Err(ErrorCode::NotFound, "alert rule " + std::to_string(id) + " not found");
}

Result ReadOnly() {
  return Result::Err(ErrorCode::InternalError, "write on a read-only transaction");
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRule(Transaction& t, model::AlertRuleRecord& r) {
  if (!TX(t).Writable()) return ReadOnly();
  auto& s = TX(t).Mutable();

  if (auto check = CheckConstraints(r); !check) return check;
  for (const auto& [_, existing] : s.rules) {
    if (SameTuple(existing, r)) return Result::Err(ErrorCode::AlreadyExists, "UNIQUE constraint failed: alert rule tuple");
  }

  const auto now_ms = util::ToUnixMillis(util::Now());
  r.id              = s.next_rule_id++;
  r.created_at_ms   = now_ms;
  r.updated_at_ms   = now_ms;
  s.rules[r.id]     = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRule(Transaction& t, model::AlertRuleRecord& r) {
  if (!TX(t).Writable()) return ReadOnly();
  auto& s  = TX(t).Mutable();
  auto  it = s.rules.find(r.id);
  if (it == s.rules.end()) return NotFound(r.id);

  if (auto check = CheckConstraints(r); !check) return check;
  for (const auto& [id, existing] : s.rules) {
    if (id != r.id && SameTuple(existing, r))
      return Result::Err(ErrorCode::AlreadyExists, "UNIQUE constraint failed: alert rule tuple");
  }

  auto& stored         = it->second;
  const auto created   = stored.created_at_ms;
  const auto prev      = stored.updated_at_ms;
  stored               = r;
  stored.created_at_ms = created;
  stored.updated_at_ms = std::max(util::ToUnixMillis(util::Now()), prev + 1);
  r                    = stored;
  return Result::Ok();
}

Result MemoryRepository::SetRuleEnabled(Transaction& t, int64_t id, bool enabled) {
  if (!TX(t).Writable()) return ReadOnly();
  auto& s  = TX(t).Mutable();
  auto  it = s.rules.find(id);
  if (it == s.rules.end()) return NotFound(id);

  it->second.enabled       = enabled;
  it->second.updated_at_ms = std::max(util::ToUnixMillis(util::Now()), it->second.updated_at_ms + 1);
  return Result::Ok();
}

Result MemoryRepository::DeleteRule(Transaction& t, int64_t id) {
  if (!TX(t).Writable()) return ReadOnly();
  auto& s = TX(t).Mutable();
  if (s.rules.erase(id) == 0) return NotFound(id);
  return Result::Ok();
}

std::optional<model::AlertRuleRecord> MemoryRepository::GetRule(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.rules.find(id);
  if (it == s.rules.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AlertRuleRecord> MemoryRepository::ListRules(Transaction& t, const model::RuleFilter& filter) {
  const auto&                         s = TX(t).View();
  std::vector<model::AlertRuleRecord> out;
  uint64_t                            skipped = 0;
  for (const auto& [_, record] : s.rules) {
    if (!Matches(record, filter)) continue;
    if (skipped < filter.offset) {
      ++skipped;
      continue;
    }
    if (filter.limit > 0 && out.size() >= filter.limit) break;
    out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountRules(Transaction& t, const model::RuleFilter& filter) {
  const auto& s = TX(t).View();
  return static_cast<uint64_t>(std::count_if(s.rules.begin(), s.rules.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

} // namespace alarmsrv::db::memory
