#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <type_traits>
#include <variant>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/time.hpp"

namespace alarmsrv::db::sqlite {

using alarmsrv::db::ErrorCode;
using alarmsrv::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(st);
        st = nullptr;
    }
    return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

void BindParams(sqlite3_stmt* st, const sql::Params& params) {
    int idx = 1;
    for (const auto& param : params) {
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    sqlite3_bind_null(st, idx);
                } else if constexpr (std::is_same_v<T, int32_t>) {
                    BindI32(st, idx, v);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    BindI64(st, idx, v);
                } else if constexpr (std::is_same_v<T, uint64_t>) {
                    BindU64(st, idx, v);
                } else if constexpr (std::is_same_v<T, double>) {
                    BindDouble(st, idx, v);
                } else {
                    BindText(st, idx, v);
                }
            },
            param);
        ++idx;
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Column order follows sql::RULE_COLUMNS.
model::AlertRuleRecord ReadRule(sqlite3_stmt* st) {
    model::AlertRuleRecord r;
    r.id = ColI64(st, 0);
    r.channel_id = ColI64(st, 1);
    r.data_type = ColText(st, 2);
    r.point_id = ColI64(st, 3);
    r.rule_name = ColText(st, 4);
    r.warning_level = ColI32(st, 5);
    r.op = ColText(st, 6);
    r.value = sqlite3_column_double(st, 7);
    r.enabled = ColI32(st, 8) != 0;
    r.description = ColText(st, 9);
    r.created_at_ms = ColU64(st, 10);
    r.updated_at_ms = ColU64(st, 11);
    return r;
}

// Binds the mutable columns in INSERT_RULE / UPDATE_RULE order, starting at 1.
void BindRuleFields(sqlite3_stmt* st, const model::AlertRuleRecord& r) {
    BindI64(st, 1, r.channel_id);
    BindText(st, 2, r.data_type);
    BindI64(st, 3, r.point_id);
    BindText(st, 4, r.rule_name);
    BindI32(st, 5, r.warning_level);
    BindText(st, 6, r.op);
    BindDouble(st, 7, r.value);
    BindI32(st, 8, r.enabled ? 1 : 0);
    BindText(st, 9, r.description);
}

std::string EscapeLike(const std::string& keyword) {
    std::string out;
    out.reserve(keyword.size() + 2);
    out.push_back('%');
    for (char c : keyword) {
        if (c == '%' || c == '_' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('%');
    return out;
}

std::string WhereClause(const model::RuleFilter& f, sql::Params& params) {
    std::string where;
    auto add = [&](const std::string& condition) {
        where += where.empty() ? " WHERE " : " AND ";
        where += condition;
    };

    if (f.channel_id) {
        add("channel_id=?");
        params.emplace_back(*f.channel_id);
    }
    if (f.data_type) {
        add("data_type=?");
        params.emplace_back(*f.data_type);
    }
    if (f.point_id) {
        add("point_id=?");
        params.emplace_back(*f.point_id);
    }
    if (f.warning_level) {
        add("warning_level=?");
        params.emplace_back(*f.warning_level);
    }
    if (f.enabled) {
        add("enabled=?");
        params.emplace_back(int32_t{*f.enabled ? 1 : 0});
    }
    if (!f.keyword.empty()) {
        add("(rule_name LIKE ? ESCAPE '\\' OR description LIKE ? ESCAPE '\\'"
            " OR CAST(channel_id AS TEXT) LIKE ? ESCAPE '\\' OR CAST(point_id AS TEXT) LIKE ? ESCAPE '\\')");
        const auto pattern = EscapeLike(f.keyword);
        for (int i = 0; i < 4; ++i) {
            params.emplace_back(pattern);
        }
    }
    if (f.created_from_ms) {
        add("created_at>=?");
        params.emplace_back(*f.created_from_ms);
    }
    if (f.created_to_ms) {
        add("created_at<=?");
        params.emplace_back(*f.created_to_ms);
    }
    return where;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(pool_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
    return std::make_unique<SqliteTransaction>(pool_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::InsertRule(Transaction& t, model::AlertRuleRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::INSERT_RULE);
    if (!st) return Translate(db, sqlite3_errcode(db));

    const auto now_ms = util::ToUnixMillis(util::Now());
    BindRuleFields(st.get(), r);
    BindU64(st.get(), 10, now_ms);
    BindU64(st.get(), 11, now_ms);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    r.created_at_ms = now_ms;
    r.updated_at_ms = now_ms;
    return Result::Ok();
}

Result SqliteRepository::UpdateRule(Transaction& t, model::AlertRuleRecord& r) {
    auto* db = TX(t).Handle();

    {
        auto st = Prepare(db, sql::UPDATE_RULE);
        if (!st) return Translate(db, sqlite3_errcode(db));

        BindRuleFields(st.get(), r);
        BindU64(st.get(), 10, util::ToUnixMillis(util::Now()));
        BindI64(st.get(), 11, r.id);

        int rc = sqlite3_step(st.get());
        if (rc != SQLITE_DONE) return Translate(db, rc);
        if (sqlite3_changes(db) == 0)
            return Result::Err(ErrorCode::NotFound, "alert rule " + std::to_string(r.id) + " not found");
    }

    auto reloaded = GetRule(t, r.id);
    if (!reloaded) return Result::Err(ErrorCode::InternalError, "updated alert rule vanished");
    r = std::move(*reloaded);
    return Result::Ok();
}

Result SqliteRepository::SetRuleEnabled(Transaction& t, int64_t id, bool enabled) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SET_RULE_ENABLED);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindI32(st.get(), 1, enabled ? 1 : 0);
    BindU64(st.get(), 2, util::ToUnixMillis(util::Now()));
    BindI64(st.get(), 3, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "alert rule " + std::to_string(id) + " not found");
    return Result::Ok();
}

Result SqliteRepository::DeleteRule(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::DELETE_RULE);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "alert rule " + std::to_string(id) + " not found");
    return Result::Ok();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<model::AlertRuleRecord>
SqliteRepository::GetRule(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, sql::SELECT_RULE);
    if (!st) ThrowSqliteError(db, sqlite3_errcode(db), "get alert rule");

    BindI64(st.get(), 1, id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowSqliteError(db, rc, "get alert rule");

    return ReadRule(st.get());
}

std::vector<model::AlertRuleRecord>
SqliteRepository::ListRules(Transaction& t, const model::RuleFilter& filter) {
    auto* db = TX(t).Handle();

    sql::Params params;
    std::string query = std::string("SELECT ") + sql::RULE_COLUMNS + " FROM alert_rule" + WhereClause(filter, params) + " ORDER BY id ASC";
    if (filter.limit > 0) {
        query += " LIMIT ? OFFSET ?";
        params.emplace_back(filter.limit);
        params.emplace_back(filter.offset);
    } else if (filter.offset > 0) {
        query += " LIMIT -1 OFFSET ?";
        params.emplace_back(filter.offset);
    }
    query += ";";

    auto st = Prepare(db, query.c_str());
    if (!st) ThrowSqliteError(db, sqlite3_errcode(db), "list alert rules");
    BindParams(st.get(), params);

    std::vector<model::AlertRuleRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadRule(st.get()));
    }
    if (rc != SQLITE_DONE) ThrowSqliteError(db, rc, "list alert rules");

    return out;
}

uint64_t SqliteRepository::CountRules(Transaction& t, const model::RuleFilter& filter) {
    auto* db = TX(t).Handle();

    sql::Params params;
    const std::string query = "SELECT COUNT(*) FROM alert_rule" + WhereClause(filter, params) + ";";

    auto st = Prepare(db, query.c_str());
    if (!st) ThrowSqliteError(db, sqlite3_errcode(db), "count alert rules");
    BindParams(st.get(), params);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_ROW) ThrowSqliteError(db, rc, "count alert rules");
    return ColU64(st.get(), 0);
}

} // namespace alarmsrv::db::sqlite
