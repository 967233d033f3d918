#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/instrument/inclusion_policy.hpp"
#include "internal/instrument/module.hpp"
#include "internal/trace/call_recorder.hpp"

namespace calltrace::instrument {

struct LoadReport {
  std::string       module;
  Module::State     state = Module::State::kNotLoaded;
  InclusionDecision decision;
  // definitions wrapped with the recorder by this load
  std::size_t wrapped = 0;
  // true when an unreadable source was loaded pass-through
  bool fell_back = false;
  // false when the module had been loaded before
  bool loaded_now = true;
};

/*
  ModuleLoader

  Applies the inclusion policy to a module and activates its
  definitions exactly once:

    included  Function rows stored, definitions wrapped
    excluded  definitions call the raw callable

  A module must be loaded before any of its definitions is called.
*/
class ModuleLoader {
 public:
  ModuleLoader(InclusionPolicy policy, std::shared_ptr<trace::CallRecorder> recorder, bool fallback_on_unreadable_source);

  // Throws util::InstrumentationError when an included module's source
  // cannot be read or a definition cannot be located in it.
  LoadReport Load(Module& module);

  std::vector<LoadReport> LoadAll(ModuleRegistry& registry);

  const InclusionPolicy& Policy() const {
    return policy_;
  }

 private:
  LoadReport PassThrough(Module& module, LoadReport report);

  InclusionPolicy                      policy_;
  std::shared_ptr<trace::CallRecorder> recorder_;
  bool                                 fallback_on_unreadable_source_;
  std::mutex                           load_mutex_;
};

} // namespace calltrace::instrument
