#pragma once

#include <string>
#include <vector>

namespace calltrace::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor. Versions are applied in order
  and recorded so re-opening an existing run file is a no-op.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual bool IsApplied(int version) = 0;

  virtual void MarkApplied(int version) = 0;
};

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

// The trace store schema, oldest first.
const std::vector<Migration>& TraceMigrations();

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace calltrace::db::sql
