#include "sqlite_schema.hpp"

#include <stdexcept>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace calltrace::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {}

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  bool IsApplied(int version) override {
    sqlite3_stmt* st = db_.Prepare("SELECT 1 FROM schema_migrations WHERE version=?;");
    sqlite3_bind_int(st, 1, version);
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw std::runtime_error("schema_migrations lookup failed: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
    return rc == SQLITE_ROW;
  }

  void MarkApplied(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("schema_migrations insert failed: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSqliteSchema(SqliteDB& db) {
  std::lock_guard lock(db.TxMutex());

  db.Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(db);
    sql::RunMigrations(executor, sql::TraceMigrations());
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  // fail early if the file holds an incompatible layout
  VerifySqliteSchema(db);
}

void VerifySqliteSchema(SqliteDB& db) {
  for (const char* table : {"function", "call", "argument"}) {
    sqlite3_stmt* st = db.Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
    sqlite3_bind_text(st, 1, table, -1, SQLITE_STATIC);
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_DONE) {
      throw std::runtime_error(db.Path() + " is not a trace database: missing table '" + table + "'");
    }
    if (rc != SQLITE_ROW) {
      throw std::runtime_error("schema lookup failed: " + std::string(sqlite3_errmsg(db.Handle())));
    }
  }

  try {
    db.Exec("SELECT id,module,qualname,filename,lineno,signature,source_code FROM function LIMIT 1;");
    db.Exec("SELECT id,function_id,parent_call_id,timestamp,duration_ms,thread_id,tb FROM call LIMIT 1;");
    db.Exec("SELECT id,call_id,name,value FROM argument LIMIT 1;");
  } catch (const std::exception& e) {
    throw std::runtime_error(db.Path() + " has an incompatible trace layout: " + e.what());
  }
}

} // namespace calltrace::db::sqlite
