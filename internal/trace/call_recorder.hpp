#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/trace/call_stack.hpp"
#include "internal/trace/function_info.hpp"
#include "internal/trace/value_formatter.hpp"
#include "internal/util/time.hpp"
#include "internal/util/type_name.hpp"

namespace calltrace::trace {

struct ExceptionInfo {
  std::string type;
  std::string message;
  std::string traceback;
};

// Describes the exception being handled. Only valid inside a catch block.
ExceptionInfo DescribeCurrentException(const CallStack& stack);

// "Traceback (most recent call last):" listing of the active traced frames.
std::string FormatTraceback(const CallStack& stack, const std::string& type, const std::string& message);

class CallRecorder;

/*
  One in-flight call between entry and completion.

  Owns the stack frame, so the frame is popped on every exit path.
  Completion is written at most once; a call whose entry row failed
  to store writes nothing.
*/
class ActiveCall {
 public:
  ActiveCall(CallRecorder& recorder, CallStack& stack, const FunctionInfo& info, std::optional<int64_t> call_id);

  ActiveCall(const ActiveCall&)            = delete;
  ActiveCall& operator=(const ActiveCall&) = delete;

  void Return(std::string return_text);

  // Call from inside the catch block that is about to rethrow.
  void Raise();

  std::optional<int64_t> CallId() const {
    return call_id_;
  }

 private:
  CallRecorder&                   recorder_;
  CallStack&                      stack_;
  std::optional<int64_t>          call_id_;
  ScopedFrame                     frame_;
  util::SteadyClock::time_point   start_;
  bool                            completed_ = false;
};

/*
  CallRecorder

  Records the lifecycle of every intercepted call:

    entry       function identity, call row, argument rows
    completion  duration + return value, or exception + traceback

  Store failures are logged and counted; they never change what the
  wrapped callable returns or throws.
*/
class CallRecorder {
 public:
  explicit CallRecorder(std::shared_ptr<db::Repository> repository);

  // Get-or-create of the Function row; cached per identity key.
  std::optional<int64_t> RegisterFunction(const FunctionInfo& info);

  std::optional<int64_t> RecordEntry(const FunctionInfo& info, int64_t function_id, std::optional<int64_t> parent,
                                     const std::optional<std::string>& class_name,
                                     std::vector<db::model::ArgumentRecord> arguments);

  void RecordCompletion(int64_t call_id, const db::model::CallOutcome& outcome);

  /*
    Runs fn(args...) as one traced call of `info`.

    function_id caches the Function row id for the definition (0 = not
    yet stored). The result or exception of fn reaches the caller
    unchanged.
  */
  template <typename F, typename... Args>
  std::invoke_result_t<F&, Args...> Intercept(const FunctionInfo& info, std::atomic<int64_t>& function_id,
                                              const std::optional<std::string>& class_name, F& fn, Args&&... args) {
    using R = std::invoke_result_t<F&, Args...>;

    auto& stack  = CallStack::Current();
    auto  parent = stack.Parent();

    std::optional<int64_t> call_id;
    if (auto fid = ResolveFunction(info, function_id)) {
      try {
        call_id = RecordEntry(info, *fid, parent, class_name, BindArguments(info, args...));
      } catch (const std::exception& e) {
        ReportStoreFailure("bind_arguments", e.what());
      }
    }

    ActiveCall active(*this, stack, info, call_id);

    // only fn's own exceptions pass through here; serialization happens outside
    auto run = [&]() -> R {
      try {
        return std::invoke(fn, std::forward<Args>(args)...);
      } catch (...) {
        active.Raise();
        throw;
      }
    };

    if constexpr (std::is_void_v<R>) {
      run();
      active.Return("null");
    } else {
      R result = run();
      if (active.CallId()) {
        active.Return(SafeText(result));
      }
      return std::forward<R>(result);
    }
  }

  std::shared_ptr<db::Repository> Repository() const {
    return repository_;
  }

  // Number of store writes that failed since construction.
  uint64_t StoreFailures() const {
    return store_failures_.load();
  }

  // Number of values that could not be serialized since construction.
  uint64_t SerializationFailures() const {
    return serialization_failures_.load();
  }

 private:
  using FunctionKey = std::tuple<std::string, std::string, std::string, int64_t>;

  std::optional<int64_t> ResolveFunction(const FunctionInfo& info, std::atomic<int64_t>& function_id);

  template <typename... Args>
  std::vector<db::model::ArgumentRecord> BindArguments(const FunctionInfo& info, const Args&... args) {
    std::vector<db::model::ArgumentRecord> bound;
    bound.reserve(sizeof...(Args));
    std::size_t index = 0;
    (bound.push_back(MakeArgument(info, index++, SafeText(args))), ...);
    return bound;
  }

  // ToText that cannot fail: a throwing conversion is reported and the
  // value is stored as its "<TypeName object>" placeholder.
  template <typename T>
  std::string SafeText(const T& value) noexcept {
    try {
      return ToText(value);
    } catch (const std::exception& e) {
      ReportSerializationFailure(typeid(T), e.what());
    } catch (...) {
      ReportSerializationFailure(typeid(T), "non-standard exception");
    }
    return OpaquePlaceholder<std::decay_t<T>>();
  }

  template <typename T>
  static std::string OpaquePlaceholder() noexcept {
    try {
      return "\"<" + util::TypeName<T>() + " object>\"";
    } catch (const std::bad_alloc&) {
      return {};
    }
  }

  void ReportSerializationFailure(const std::type_info& type, const char* detail) noexcept;

  static db::model::ArgumentRecord MakeArgument(const FunctionInfo& info, std::size_t index, std::string value);

  void ReportStoreFailure(const char* operation, const std::string& detail);

  std::shared_ptr<db::Repository> repository_;

  std::mutex                         registry_mutex_;
  std::map<FunctionKey, int64_t>     registry_;

  std::atomic<uint64_t> store_failures_{0};
  std::atomic<uint64_t> serialization_failures_{0};
};

} // namespace calltrace::trace
