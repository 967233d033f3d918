#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/instrument/definition.hpp"
#include "internal/instrument/function_traits.hpp"
#include "internal/trace/function_info.hpp"
#include "internal/trace/value_formatter.hpp"
#include "internal/util/errors.hpp"

namespace calltrace::instrument {

struct DefinitionOptions {
  // Parameter names in declaration order; unnamed ones are stored as arg<i>.
  std::vector<std::string> params;

  // Default argument spellings, by parameter name.
  std::vector<std::pair<std::string, std::string>> defaults;

  // Captured state of a lambda, by capture name.
  std::vector<std::pair<std::string, std::string>> closure_vars;

  // Unset: instancemethod for member pointers, function otherwise.
  std::optional<trace::CallKind> kind;

  // Owner recorded for class and static methods.
  std::string class_name;

  // 0: located by the loader in the module's source.
  int64_t line = 0;

  bool coroutine = false;
};

class ModuleRegistry;

/*
  Module

  One traced translation unit. Definitions are registered while the
  module is NotLoaded; ModuleLoader then decides once whether the
  module is instrumented or passed through and activates every
  definition accordingly.

    static calltrace::v1::Module kModule("orders", __FILE__);
    static auto place = CALLTRACE_DEFINE(kModule, PlaceOrder, {.params = {"id", "qty"}});
*/
class Module {
 public:
  enum class State {
    kNotLoaded,
    kInstrumented,
    kPassThrough,
  };

  Module(std::string name, std::string source_file);
  Module(std::string name, std::string source_file, ModuleRegistry& registry);
  ~Module();

  Module(const Module&)            = delete;
  Module& operator=(const Module&) = delete;

  template <typename F>
  auto Define(std::string qualname, F&& fn, DefinitionOptions options = {});

  const std::string& Name() const {
    return name_;
  }

  const std::string& SourceFile() const {
    return source_file_;
  }

  State GetState() const;

  std::vector<std::shared_ptr<DefinitionBase>> Definitions() const;

  // Loader-only: false if the module already left NotLoaded.
  bool TransitionTo(State state);

 private:
  trace::FunctionInfo MakeInfo(std::string qualname, const DefinitionOptions& options) const;
  void                Add(std::shared_ptr<DefinitionBase> definition);

  std::string     name_;
  std::string     source_file_;
  ModuleRegistry* registry_;

  mutable std::mutex                           mutex_;
  State                                        state_ = State::kNotLoaded;
  std::vector<std::shared_ptr<DefinitionBase>> definitions_;
};

const char* ToString(Module::State state);

/*
  Every Module constructed in the process, in construction order.
*/
class ModuleRegistry {
 public:
  static ModuleRegistry& Instance();

  void Register(Module* module);
  void Unregister(Module* module);

  std::vector<Module*> Modules() const;

  Module* Find(const std::string& name) const;

 private:
  mutable std::mutex   mutex_;
  std::vector<Module*> modules_;
};

// ------------------------------------------------------------
// Define
// ------------------------------------------------------------

namespace detail {

template <typename Sig>
struct Annotate;

template <typename R, typename... A>
struct Annotate<R(A...)> {
  static std::string Json(const std::vector<std::string>& names) {
    const auto types = SignatureOf<R(A...)>::ParameterTypes();

    std::vector<std::pair<std::string, std::string>> entries;
    for (std::size_t i = 0; i < types.size(); ++i) {
      const bool named = i < names.size() && !names[i].empty();
      entries.emplace_back(named ? names[i] : "arg" + std::to_string(i), types[i]);
    }
    entries.emplace_back("return", SignatureOf<R(A...)>::ReturnType());
    return trace::ToJsonObject(entries);
  }
};

template <typename C, typename Sig>
struct ReceiverSignature;

template <typename C, typename R, typename... A>
struct ReceiverSignature<C, R(A...)> {
  using type = R(C&, A...);
};

} // namespace detail

template <typename F>
auto Module::Define(std::string qualname, F&& fn, DefinitionOptions options) {
  using Traits = FunctionTraits<std::decay_t<F>>;
  using Sig    = typename Traits::Signature;

  auto info = MakeInfo(std::move(qualname), options);

  if constexpr (Traits::kMember) {
    using Receiver = std::conditional_t<Traits::kConst, const typename Traits::Class, typename Traits::Class>;
    using Full     = typename detail::ReceiverSignature<Receiver, Sig>::type;

    info.param_names.insert(info.param_names.begin(), "self");
    if (!options.kind) info.kind = trace::CallKind::kInstanceMethod;
    if (info.class_name.empty()) {
      info.class_name = util::ShortTypeName(util::TypeName<typename Traits::Class>());
    }
    info.signature   = SignatureOf<Full>::Text(info.param_names);
    info.annotations = detail::Annotate<Full>::Json(info.param_names);

    auto definition =
        std::make_shared<MethodDefinition<Receiver, Sig>>(std::move(info), std::function<Full>(std::forward<F>(fn)));
    Add(definition);
    return Traced<Full>(std::move(definition));
  } else {
    info.signature   = SignatureOf<Sig>::Text(info.param_names);
    info.annotations = detail::Annotate<Sig>::Json(info.param_names);

    auto definition =
        std::make_shared<FunctionDefinition<Sig>>(std::move(info), std::function<Sig>(std::forward<F>(fn)));
    Add(definition);
    return Traced<Sig>(std::move(definition));
  }
}

} // namespace calltrace::instrument

// Registers a named free or static function under its spelled name.
#define CALLTRACE_DEFINE(module, fn, ...) (module).Define(#fn, &fn, ##__VA_ARGS__)

// Registers an instance method as "Class::method".
#define CALLTRACE_METHOD(module, cls, method, ...) (module).Define(#cls "::" #method, &cls::method, ##__VA_ARGS__)
