#pragma once

namespace alarmsrv::db::sql {

/*
  Canonical SQL for the alert_rule table.

  Column order of RULE_COLUMNS is the order every SELECT returns and the
  order the row readers expect.
*/

#define ALARMSRV_RULE_COLUMNS                                                              \
  "id,channel_id,data_type,point_id,rule_name,warning_level,operator,value,enabled,"      \
  "description,created_at,updated_at"

static constexpr const char* RULE_COLUMNS = ALARMSRV_RULE_COLUMNS;

static constexpr const char* INSERT_RULE =
    "INSERT INTO alert_rule(channel_id,data_type,point_id,rule_name,warning_level,operator,"
    "value,enabled,description,created_at,updated_at)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_RULE =
    "SELECT " ALARMSRV_RULE_COLUMNS " FROM alert_rule WHERE id=?;";

// updated_at never moves backwards or stands still, even within one millisecond
static constexpr const char* UPDATE_RULE =
    "UPDATE alert_rule SET channel_id=?,data_type=?,point_id=?,rule_name=?,warning_level=?,"
    "operator=?,value=?,enabled=?,description=?,updated_at=MAX(?,updated_at+1)"
    " WHERE id=?;";

static constexpr const char* SET_RULE_ENABLED =
    "UPDATE alert_rule SET enabled=?,updated_at=MAX(?,updated_at+1) WHERE id=?;";

static constexpr const char* DELETE_RULE =
    "DELETE FROM alert_rule WHERE id=?;";

// schema

static constexpr const char* CREATE_RULE_TABLE =
    "CREATE TABLE IF NOT EXISTS alert_rule ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " channel_id INTEGER NOT NULL CHECK(channel_id > 0),"
    " data_type TEXT NOT NULL CHECK(data_type IN ('T','S','C','A')),"
    " point_id INTEGER NOT NULL CHECK(point_id > 0),"
    " rule_name TEXT NOT NULL CHECK(length(trim(rule_name,' '||char(9,10,11,12,13))) > 0),"
    " warning_level INTEGER NOT NULL CHECK(warning_level IN (1,2,3)),"
    " operator TEXT NOT NULL CHECK(operator IN ('>','<','>=','<=','==','!=')),"
    " value REAL NOT NULL CHECK(abs(value) <= 1.7976931348623157e308),"
    " enabled INTEGER NOT NULL DEFAULT 1 CHECK(enabled IN (0,1)),"
    " description TEXT NOT NULL DEFAULT '',"
    " created_at INTEGER NOT NULL,"
    " updated_at INTEGER NOT NULL,"
    " UNIQUE(channel_id,data_type,point_id,rule_name));";

static constexpr const char* CREATE_RULE_INDEXES[] = {
    "CREATE INDEX IF NOT EXISTS idx_alert_rule_channel_type_point ON alert_rule(channel_id,data_type,point_id);",
    "CREATE INDEX IF NOT EXISTS idx_alert_rule_enabled ON alert_rule(enabled);",
    "CREATE INDEX IF NOT EXISTS idx_alert_rule_warning_level ON alert_rule(warning_level);",
    "CREATE INDEX IF NOT EXISTS idx_alert_rule_created_at ON alert_rule(created_at);",
};

static constexpr const char* CREATE_MIGRATIONS_TABLE =
    "CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);";

}
