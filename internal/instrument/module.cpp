#include "internal/instrument/module.hpp"

#include <algorithm>

namespace calltrace::instrument {

Module::Module(std::string name, std::string source_file)
    : Module(std::move(name), std::move(source_file), ModuleRegistry::Instance()) {
}

Module::Module(std::string name, std::string source_file, ModuleRegistry& registry)
    : name_(std::move(name)), source_file_(std::move(source_file)), registry_(&registry) {
  registry_->Register(this);
}

Module::~Module() {
  registry_->Unregister(this);
}

Module::State Module::GetState() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::vector<std::shared_ptr<DefinitionBase>> Module::Definitions() const {
  std::lock_guard lock(mutex_);
  return definitions_;
}

bool Module::TransitionTo(State state) {
  std::lock_guard lock(mutex_);
  if (state_ != State::kNotLoaded || state == State::kNotLoaded) return false;
  state_ = state;
  return true;
}

trace::FunctionInfo Module::MakeInfo(std::string qualname, const DefinitionOptions& options) const {
  trace::FunctionInfo info;
  info.module       = name_;
  info.qualname     = std::move(qualname);
  info.filename     = source_file_;
  info.lineno       = options.line;
  info.param_names  = options.params;
  info.kind         = options.kind.value_or(trace::CallKind::kFunction);
  info.class_name   = options.class_name;
  info.is_coroutine = options.coroutine;

  if (!options.defaults.empty()) {
    info.defaults = trace::ToJsonObject(options.defaults);
  }
  if (!options.closure_vars.empty()) {
    info.closure_vars = trace::ToJsonObject(options.closure_vars);
  }
  return info;
}

void Module::Add(std::shared_ptr<DefinitionBase> definition) {
  std::lock_guard lock(mutex_);
  if (state_ != State::kNotLoaded) {
    throw util::InvalidState("module '" + name_ + "' is already loaded; cannot define '" + definition->Info().qualname + "'");
  }
  definitions_.push_back(std::move(definition));
}

const char* ToString(Module::State state) {
  switch (state) {
    case Module::State::kNotLoaded:
      return "not_loaded";
    case Module::State::kInstrumented:
      return "instrumented";
    case Module::State::kPassThrough:
      return "pass_through";
  }
  return "unknown";
}

// ------------------------------------------------------------
// ModuleRegistry
// ------------------------------------------------------------

ModuleRegistry& ModuleRegistry::Instance() {
  static ModuleRegistry registry;
  return registry;
}

void ModuleRegistry::Register(Module* module) {
  std::lock_guard lock(mutex_);
  modules_.push_back(module);
}

void ModuleRegistry::Unregister(Module* module) {
  std::lock_guard lock(mutex_);
  modules_.erase(std::remove(modules_.begin(), modules_.end(), module), modules_.end());
}

std::vector<Module*> ModuleRegistry::Modules() const {
  std::lock_guard lock(mutex_);
  return modules_;
}

Module* ModuleRegistry::Find(const std::string& name) const {
  std::lock_guard lock(mutex_);
  for (auto* module : modules_) {
    if (module->Name() == name) return module;
  }
  return nullptr;
}

} // namespace calltrace::instrument
