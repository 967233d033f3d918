#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "calltrace/config/v1/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/instrument/module_loader.hpp"
#include "internal/trace/call_recorder.hpp"

namespace calltrace::factory {

/*
  RuntimeDependencies

  Owns everything a traced run needs. Lives for the lifetime of the
  process; definitions hold the recorder after their module loads.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<trace::CallRecorder>         recorder;
  std::shared_ptr<instrument::ModuleLoader>    loader;

  // empty for the memory backend
  std::filesystem::path database_path;
};

/*
  BuildRuntime

  Composition root: the ONLY place that knows concrete store types.
  Throws std::runtime_error when the store cannot be opened.
*/
RuntimeDependencies BuildRuntime(const calltrace::runtime::config::RuntimeConfig& config);

// Opens an existing run file read-only. Throws std::runtime_error when the
// file is missing or holds no trace tables; the file is never modified.
std::shared_ptr<db::Repository> OpenRepository(const std::filesystem::path& database_path);

// run_<YYYYmmdd_HHMMSS>.db under the configured directory, or the explicit path.
std::filesystem::path ResolveDatabasePath(const calltrace::runtime::config::SqliteConfig& sqlite);

} // namespace calltrace::factory
