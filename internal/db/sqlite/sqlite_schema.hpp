#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace calltrace::db::sqlite {

// Creates or upgrades the function/call/argument tables.
void BootstrapSqliteSchema(SqliteDB& db);

// Checks the trace tables without creating anything; throws
// std::runtime_error when the file is not a trace store.
void VerifySqliteSchema(SqliteDB& db);

} // namespace calltrace::db::sqlite
