#include "trace_runtime.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace calltrace::runtime {

using observability::IntField;
using observability::StringField;

TraceRuntime::TraceRuntime(calltrace::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

TraceRuntime::~TraceRuntime() {
  try {
    Stop();
  } catch (const std::exception& e) {
    CALLTRACE_LOG_ERROR("trace runtime shutdown failed", {StringField("error", e.what())});
  }
}

void TraceRuntime::Start() {
  if (started_) return;

  observability::InitializeLogging(config_);
  deps_    = factory::BuildRuntime(config_);
  reports_ = deps_.loader->LoadAll(instrument::ModuleRegistry::Instance());
  started_ = true;

  std::size_t instrumented = 0;
  for (const auto& report : reports_) {
    if (report.state == instrument::Module::State::kInstrumented) ++instrumented;
  }
  CALLTRACE_LOG_INFO("trace run started", {IntField("modules", static_cast<int64_t>(reports_.size())),
                                           IntField("instrumented", static_cast<int64_t>(instrumented))});
}

instrument::LoadReport TraceRuntime::Load(instrument::Module& module) {
  if (!started_) {
    throw util::InvalidState("TraceRuntime::Load before Start");
  }
  auto report = deps_.loader->Load(module);
  if (report.loaded_now) {
    reports_.push_back(report);
  }
  return report;
}

void TraceRuntime::Stop() {
  if (!started_) return;
  started_ = false;

  const auto failures = deps_.recorder->StoreFailures();
  if (failures > 0) {
    CALLTRACE_LOG_WARN("trace run finished with store failures", {IntField("failures", static_cast<int64_t>(failures))});
  }
  CALLTRACE_LOG_INFO("trace run stopped", {StringField("database", deps_.database_path.string())});
  observability::FlushLogging();
}

} // namespace calltrace::runtime
