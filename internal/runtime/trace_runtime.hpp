#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "calltrace/config/v1/config.pb.h"

#include "internal/factory.hpp"
#include "internal/instrument/module_loader.hpp"

namespace calltrace::runtime {

/*
  TraceRuntime

  Process-level handle of one traced run:

    Start()  logging, store, loader; loads every registered module
    Stop()   logs the run summary; idempotent, also run by the destructor

  Modules constructed after Start() are loaded with Load().
*/
class TraceRuntime {
 public:
  explicit TraceRuntime(calltrace::runtime::config::RuntimeConfig config);
  ~TraceRuntime();

  TraceRuntime(const TraceRuntime&)            = delete;
  TraceRuntime& operator=(const TraceRuntime&) = delete;

  void Start();
  void Stop();

  instrument::LoadReport Load(instrument::Module& module);

  const std::vector<instrument::LoadReport>& Reports() const {
    return reports_;
  }

  // Empty for the memory backend.
  const std::filesystem::path& DatabasePath() const {
    return deps_.database_path;
  }

  const factory::RuntimeDependencies& Dependencies() const {
    return deps_;
  }

 private:
  calltrace::runtime::config::RuntimeConfig config_;
  factory::RuntimeDependencies              deps_;
  std::vector<instrument::LoadReport>       reports_;
  bool                                      started_ = false;
};

} // namespace calltrace::runtime
