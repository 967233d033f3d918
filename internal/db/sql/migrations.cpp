#include "migrations.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace calltrace::db::sql {

const std::vector<Migration>& TraceMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {CREATE_FUNCTION_TABLE, CREATE_CALL_TABLE, CREATE_ARGUMENT_TABLE}},
      {2,
       {CREATE_CALL_PARENT_INDEX, CREATE_ARGUMENT_CALL_INDEX}},
  };
  return kMigrations;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  executor.ExecuteSQL(CREATE_MIGRATIONS_TABLE);

  for (const auto& migration : ordered) {
    if (executor.IsApplied(migration.version)) continue;

    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.MarkApplied(migration.version);
  }
}

} // namespace calltrace::db::sql
