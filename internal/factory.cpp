#include "factory.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/instrument/inclusion_policy.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#if CALLTRACE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace calltrace::factory {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

fs::path WorkingDirectory() {
  if (const char* cwd = std::getenv("CALLTRACE_CWD")) {
    return fs::path(cwd);
  }
  return fs::current_path();
}

#if CALLTRACE_DB_SQLITE
std::shared_ptr<db::Repository> OpenSqlite(const fs::path& path, const calltrace::runtime::config::SqliteConfig& config) {
  db::sqlite::SqliteOptions options;
  options.busy_timeout_ms = config.has_busy_timeout_ms() ? static_cast<int>(config.busy_timeout_ms()) : options.busy_timeout_ms;
  options.wal_mode        = config.has_wal_mode() ? config.wal_mode() : options.wal_mode;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string(), options);
  db::sqlite::BootstrapSqliteSchema(*sqlite_db);
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}
#endif

} // namespace

fs::path ResolveDatabasePath(const calltrace::runtime::config::SqliteConfig& sqlite) {
  if (!sqlite.path().empty()) {
    fs::path path(sqlite.path());
    return path.is_absolute() ? path : WorkingDirectory() / path;
  }

  fs::path directory(sqlite.directory().empty() ? "run_dbs" : sqlite.directory());
  if (!directory.is_absolute()) {
    directory = WorkingDirectory() / directory;
  }
  return directory / ("run_" + util::FormatRunStamp(util::Now()) + ".db");
}

RuntimeDependencies BuildRuntime(const calltrace::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Trace store
  // ------------------------------------------------------------------
  const auto& database = config.database();
  if (database.backend() == "memory") {
    deps.repository = std::make_shared<db::memory::MemoryRepository>();
  } else if (database.backend().empty() || database.backend() == "sqlite") {
#if CALLTRACE_DB_SQLITE
    deps.database_path = ResolveDatabasePath(database.sqlite());

    std::error_code ec;
    fs::create_directories(deps.database_path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create database directory " + deps.database_path.parent_path().string() + ": " +
                               ec.message());
    }
    deps.repository = OpenSqlite(deps.database_path, database.sqlite());
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else {
    throw std::runtime_error("unknown database backend '" + database.backend() + "'");
  }

  // ------------------------------------------------------------------
  // Recorder and loader
  // ------------------------------------------------------------------
  deps.recorder = std::make_shared<trace::CallRecorder>(deps.repository);

  const auto& instrumentation = config.instrumentation();
  instrument::InclusionPolicy policy(instrument::InclusionRules::FromConfig(instrumentation));
  deps.loader = std::make_shared<instrument::ModuleLoader>(std::move(policy), deps.recorder,
                                                           instrumentation.fallback_on_unreadable_source());

  CALLTRACE_LOG_INFO("trace runtime ready",
                     {StringField("backend", database.backend().empty() ? "sqlite" : database.backend()),
                      StringField("database", deps.database_path.string()),
                      StringField("project_root", deps.loader->Policy().Rules().project_root.string())});
  return deps;
}

std::shared_ptr<db::Repository> OpenRepository(const fs::path& database_path) {
#if CALLTRACE_DB_SQLITE
  std::error_code ec;
  if (!fs::is_regular_file(database_path, ec)) {
    throw std::runtime_error("no trace database at " + database_path.string());
  }
  db::sqlite::SqliteOptions options;
  options.read_only = true;

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database_path.string(), options);
  db::sqlite::VerifySqliteSchema(*sqlite_db);
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
  throw std::runtime_error("sqlite backend not enabled at build time");
#endif
}

} // namespace calltrace::factory
