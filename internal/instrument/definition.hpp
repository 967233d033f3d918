#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>

#include "internal/trace/call_recorder.hpp"
#include "internal/trace/function_info.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/type_name.hpp"

namespace calltrace::instrument {

/*
  A registered callable of a module.

  Lifecycle:
    defined   -> not callable (module not loaded)
    activated -> wrapped (recorder set) or pass-through (recorder null)

  Activation happens once, from the loader, before the first call.
*/
class DefinitionBase {
 public:
  explicit DefinitionBase(trace::FunctionInfo info) : info_(std::move(info)) {}
  virtual ~DefinitionBase() = default;

  DefinitionBase(const DefinitionBase&)            = delete;
  DefinitionBase& operator=(const DefinitionBase&) = delete;

  const trace::FunctionInfo& Info() const {
    return info_;
  }

  // Loader-only: completes identity fields before activation.
  trace::FunctionInfo& MutableInfo() {
    return info_;
  }

  // false if the definition was already activated
  bool Activate(std::shared_ptr<trace::CallRecorder> recorder, std::optional<int64_t> function_id) {
    std::lock_guard lock(activation_mutex_);
    if (active_.load(std::memory_order_relaxed)) return false;

    recorder_ = std::move(recorder);
    if (function_id) function_id_.store(*function_id, std::memory_order_relaxed);
    active_.store(true, std::memory_order_release);
    return true;
  }

  bool IsActive() const {
    return active_.load(std::memory_order_acquire);
  }

  bool IsInstrumented() const {
    return IsActive() && recorder_ != nullptr;
  }

  // Function row id; 0 until stored.
  int64_t FunctionId() const {
    return function_id_.load(std::memory_order_acquire);
  }

 protected:
  void RequireActive() const {
    if (!IsActive()) {
      throw util::InvalidState("'" + info_.qualname + "' called before module '" + info_.module + "' was loaded");
    }
  }

  trace::FunctionInfo                  info_;
  std::shared_ptr<trace::CallRecorder> recorder_;
  std::atomic<int64_t>                 function_id_{0};

 private:
  std::mutex        activation_mutex_;
  std::atomic<bool> active_{false};
};

template <typename Sig>
class DefinitionOf;

template <typename R, typename... Args>
class DefinitionOf<R(Args...)> : public DefinitionBase {
 public:
  using DefinitionBase::DefinitionBase;

  virtual R Invoke(Args... args) = 0;
};

// Free functions, static and class-level functions, lambdas.
template <typename Sig>
class FunctionDefinition;

template <typename R, typename... Args>
class FunctionDefinition<R(Args...)> final : public DefinitionOf<R(Args...)> {
 public:
  using Target = std::function<R(Args...)>;

  FunctionDefinition(trace::FunctionInfo info, Target target)
      : DefinitionOf<R(Args...)>(std::move(info)), target_(std::move(target)) {
    if (!this->info_.class_name.empty()) {
      class_name_ = this->info_.class_name;
    }
  }

  R Invoke(Args... args) override {
    this->RequireActive();
    if (!this->recorder_) {
      return std::invoke(target_, std::forward<Args>(args)...);
    }
    return this->recorder_->Intercept(this->info_, this->function_id_, class_name_, target_, std::forward<Args>(args)...);
  }

 private:
  Target                     target_;
  std::optional<std::string> class_name_;
};

// Instance methods; the receiver is the first parameter of the handle.
template <typename C, typename Sig>
class MethodDefinition;

template <typename C, typename R, typename... Args>
class MethodDefinition<C, R(Args...)> final : public DefinitionOf<R(C&, Args...)> {
 public:
  using Target = std::function<R(C&, Args...)>;

  MethodDefinition(trace::FunctionInfo info, Target target)
      : DefinitionOf<R(C&, Args...)>(std::move(info)), target_(std::move(target)) {}

  R Invoke(C& self, Args... args) override {
    this->RequireActive();
    if (!this->recorder_) {
      return std::invoke(target_, self, std::forward<Args>(args)...);
    }

    // owner is the receiver's dynamic type, like a bound method's class
    const std::optional<std::string> owner = util::ShortTypeName(util::TypeName(typeid(self)));

    auto bound = [this, &self](Args&&... forwarded) -> R {
      return std::invoke(target_, self, std::forward<Args>(forwarded)...);
    };
    return this->recorder_->Intercept(this->info_, this->function_id_, owner, bound, std::forward<Args>(args)...);
  }

 private:
  Target target_;
};

/*
  Traced<Sig>

  Value handle returned by Module::Define. Callable with exactly the
  wrapped callable's signature; copies share one definition.
*/
template <typename Sig>
class Traced;

template <typename R, typename... Args>
class Traced<R(Args...)> {
 public:
  Traced() = default;
  explicit Traced(std::shared_ptr<DefinitionOf<R(Args...)>> definition) : definition_(std::move(definition)) {}

  R operator()(Args... args) const {
    if (!definition_) {
      throw util::InvalidState("call through an empty Traced handle");
    }
    return definition_->Invoke(std::forward<Args>(args)...);
  }

  const trace::FunctionInfo& Info() const {
    return definition_->Info();
  }

  std::string Name() const {
    return definition_->Info().Name();
  }

  const std::string& QualifiedName() const {
    return definition_->Info().qualname;
  }

  const std::string& Signature() const {
    return definition_->Info().signature;
  }

  bool IsInstrumented() const {
    return definition_ && definition_->IsInstrumented();
  }

  explicit operator bool() const {
    return definition_ != nullptr;
  }

 private:
  std::shared_ptr<DefinitionOf<R(Args...)>> definition_;
};

} // namespace calltrace::instrument
