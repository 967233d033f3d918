#include "internal/instrument/module_loader.hpp"

#include <optional>
#include <stdexcept>

#include "internal/instrument/source_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace calltrace::instrument {

using observability::IntField;
using observability::StringField;

ModuleLoader::ModuleLoader(InclusionPolicy policy, std::shared_ptr<trace::CallRecorder> recorder, bool fallback_on_unreadable_source)
    : policy_(std::move(policy)), recorder_(std::move(recorder)), fallback_on_unreadable_source_(fallback_on_unreadable_source) {
  if (!recorder_) {
    throw std::invalid_argument("ModuleLoader: recorder must not be null");
  }
}

LoadReport ModuleLoader::PassThrough(Module& module, LoadReport report) {
  for (const auto& definition : module.Definitions()) {
    definition->Activate(nullptr, std::nullopt);
  }
  module.TransitionTo(Module::State::kPassThrough);
  report.state = Module::State::kPassThrough;
  return report;
}

LoadReport ModuleLoader::Load(Module& module) {
  std::lock_guard lock(load_mutex_);

  LoadReport report;
  report.module = module.Name();

  if (const auto state = module.GetState(); state != Module::State::kNotLoaded) {
    report.state      = state;
    report.loaded_now = false;
    return report;
  }

  report.decision = policy_.Evaluate(module.SourceFile());
  if (!report.decision.Included()) {
    CALLTRACE_LOG_DEBUG("module loaded pass-through", {StringField("module", module.Name()),
                                                       StringField("reason", ToString(report.decision.verdict)),
                                                       StringField("detail", report.decision.detail)});
    return PassThrough(module, std::move(report));
  }

  std::optional<SourceIndex> source;
  try {
    source.emplace(SourceIndex::Read(report.decision.resolved));
  } catch (const util::InstrumentationError& e) {
    if (!fallback_on_unreadable_source_) {
      throw util::InstrumentationError("module '" + module.Name() + "': " + e.what());
    }
    CALLTRACE_LOG_WARN("module source unreadable; loading uninstrumented",
                       {StringField("module", module.Name()), StringField("error", e.what())});
    report.fell_back = true;
    return PassThrough(module, std::move(report));
  }

  const auto definitions = module.Definitions();

  // resolve every definition before activating any; a failed load activates nothing
  for (const auto& definition : definitions) {
    auto& info    = definition->MutableInfo();
    info.filename = report.decision.resolved.string();

    if (info.lineno == 0) {
      const auto line = source->FindDefinition(info.qualname);
      if (!line) {
        if (!fallback_on_unreadable_source_) {
          throw util::InstrumentationError("module '" + module.Name() + "': no definition of '" + info.qualname + "' in " +
                                           info.filename);
        }
        CALLTRACE_LOG_WARN("definition not found in source",
                           {StringField("module", module.Name()), StringField("qualname", info.qualname)});
        continue;
      }
      info.lineno = *line;
    }
    info.source_code = source->ExtractBody(info.lineno);
  }

  for (const auto& definition : definitions) {
    // the store may be unreachable; the definition is still wrapped and
    // registers lazily on its first call
    const auto function_id = recorder_->RegisterFunction(definition->Info());
    if (definition->Activate(recorder_, function_id)) {
      ++report.wrapped;
    }
  }

  module.TransitionTo(Module::State::kInstrumented);
  report.state = Module::State::kInstrumented;

  CALLTRACE_LOG_INFO("module instrumented", {StringField("module", module.Name()), StringField("file", report.decision.resolved.string()),
                                             IntField("definitions", static_cast<int64_t>(report.wrapped))});
  return report;
}

std::vector<LoadReport> ModuleLoader::LoadAll(ModuleRegistry& registry) {
  std::vector<LoadReport> reports;
  for (auto* module : registry.Modules()) {
    reports.push_back(Load(*module));
  }
  return reports;
}

} // namespace calltrace::instrument
