#pragma once

namespace calltrace::db::sql {

/*
  Canonical SQL for the trace store.

  IMPORTANT:
  Table and column names are the persisted interchange format.
  Offline consumers read them directly; do not rename.
*/

// schema

static constexpr const char* CREATE_FUNCTION_TABLE =
    "CREATE TABLE IF NOT EXISTS function ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " module TEXT NOT NULL,"
    " qualname TEXT NOT NULL,"
    " filename TEXT NOT NULL,"
    " lineno INTEGER NOT NULL,"
    " signature TEXT NOT NULL,"
    " annotations TEXT,"
    " defaults TEXT,"
    " kwdefaults TEXT,"
    " closure_vars TEXT,"
    " source_code TEXT,"
    " UNIQUE(module, qualname, filename, lineno));";

static constexpr const char* CREATE_CALL_TABLE =
    "CREATE TABLE IF NOT EXISTS call ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " function_id INTEGER NOT NULL REFERENCES function(id),"
    " parent_call_id INTEGER REFERENCES call(id),"
    " timestamp REAL NOT NULL,"
    " duration_ms REAL,"
    " thread_id INTEGER NOT NULL,"
    " is_coroutine INTEGER NOT NULL,"
    " method_type TEXT NOT NULL,"
    " class_name TEXT,"
    " return_value TEXT,"
    " exception_type TEXT,"
    " exception_message TEXT,"
    " tb TEXT);";

static constexpr const char* CREATE_ARGUMENT_TABLE =
    "CREATE TABLE IF NOT EXISTS argument ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " call_id INTEGER NOT NULL REFERENCES call(id),"
    " name TEXT NOT NULL,"
    " value TEXT NOT NULL);";

static constexpr const char* CREATE_CALL_PARENT_INDEX =
    "CREATE INDEX IF NOT EXISTS ix_call_parent ON call(parent_call_id);";

static constexpr const char* CREATE_ARGUMENT_CALL_INDEX =
    "CREATE INDEX IF NOT EXISTS ix_argument_call ON argument(call_id);";

static constexpr const char* CREATE_MIGRATIONS_TABLE =
    "CREATE TABLE IF NOT EXISTS schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms INTEGER NOT NULL);";

// function

static constexpr const char* INSERT_FUNCTION_IF_ABSENT =
    "INSERT INTO function(module,qualname,filename,lineno,signature,"
    "annotations,defaults,kwdefaults,closure_vars,source_code)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(module,qualname,filename,lineno) DO NOTHING;";

static constexpr const char* SELECT_FUNCTION_COLUMNS =
    "SELECT id,module,qualname,filename,lineno,signature,"
    "annotations,defaults,kwdefaults,closure_vars,source_code FROM function";

static constexpr const char* SELECT_FUNCTION_BY_KEY =
    "SELECT id,module,qualname,filename,lineno,signature,"
    "annotations,defaults,kwdefaults,closure_vars,source_code FROM function"
    " WHERE module=? AND qualname=? AND filename=? AND lineno=?;";

static constexpr const char* SELECT_FUNCTION_BY_ID =
    "SELECT id,module,qualname,filename,lineno,signature,"
    "annotations,defaults,kwdefaults,closure_vars,source_code FROM function"
    " WHERE id=?;";

// call

static constexpr const char* INSERT_CALL =
    "INSERT INTO call(function_id,parent_call_id,timestamp,thread_id,"
    "is_coroutine,method_type,class_name)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* COMPLETE_CALL =
    "UPDATE call SET duration_ms=?,return_value=?,exception_type=?,"
    "exception_message=?,tb=?"
    " WHERE id=? AND duration_ms IS NULL;";

static constexpr const char* SELECT_CALL_EXISTS =
    "SELECT 1 FROM call WHERE id=?;";

static constexpr const char* SELECT_CALL_COLUMNS =
    "SELECT c.id,c.function_id,c.parent_call_id,c.timestamp,c.duration_ms,"
    "c.thread_id,c.is_coroutine,c.method_type,c.class_name,c.return_value,"
    "c.exception_type,c.exception_message,c.tb FROM call c";

static constexpr const char* SELECT_CALL_WITH_FUNCTION_COLUMNS =
    "SELECT c.id,c.function_id,c.parent_call_id,c.timestamp,c.duration_ms,"
    "c.thread_id,c.is_coroutine,c.method_type,c.class_name,c.return_value,"
    "c.exception_type,c.exception_message,c.tb,f.module,f.qualname"
    " FROM call c JOIN function f ON f.id=c.function_id";

// argument

static constexpr const char* INSERT_ARGUMENT =
    "INSERT INTO argument(call_id,name,value) VALUES(?,?,?);";

static constexpr const char* SELECT_ARGUMENTS_BY_CALL =
    "SELECT id,call_id,name,value FROM argument WHERE call_id=? ORDER BY id;";

static constexpr const char* SELECT_ARGUMENTS_WITH_CALL =
    "SELECT a.id,a.call_id,a.name,a.value,c.function_id,c.timestamp"
    " FROM argument a JOIN call c ON c.id=a.call_id ORDER BY a.id;";

} // namespace calltrace::db::sql
