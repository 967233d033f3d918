#include "internal/trace/call_recorder.hpp"

#include <cxxabi.h>

#include <exception>
#include <sstream>
#include <typeinfo>

#include "internal/observability/logging.hpp"
#include "internal/util/type_name.hpp"

namespace calltrace::trace {

using observability::IntField;
using observability::StringField;

// ------------------------------------------------------------
// Exceptions
// ------------------------------------------------------------

ExceptionInfo DescribeCurrentException(const CallStack& stack) {
  ExceptionInfo info;
  try {
    throw;
  } catch (const std::exception& e) {
    info.type    = util::ShortTypeName(util::TypeName(typeid(e)));
    info.message = e.what();
  } catch (...) {
    // non-std exception: the type is all we can learn; the caller rethrows
    const std::type_info* type = abi::__cxa_current_exception_type();
    info.type                  = type ? util::ShortTypeName(util::TypeName(*type)) : "unknown";
  }
  info.traceback = FormatTraceback(stack, info.type, info.message);
  return info;
}

std::string FormatTraceback(const CallStack& stack, const std::string& type, const std::string& message) {
  std::ostringstream out;
  out << "Traceback (most recent call last):\n";
  for (const auto& frame : stack.Frames()) {
    if (!frame.info) continue;
    out << "  File \"" << frame.info->filename << "\", line " << frame.info->lineno << ", in " << frame.info->qualname << "\n";
  }
  out << type;
  if (!message.empty()) {
    out << ": " << message;
  }
  out << "\n";
  return out.str();
}

// ------------------------------------------------------------
// ActiveCall
// ------------------------------------------------------------

ActiveCall::ActiveCall(CallRecorder& recorder, CallStack& stack, const FunctionInfo& info, std::optional<int64_t> call_id)
    : recorder_(recorder),
      stack_(stack),
      call_id_(call_id),
      frame_(stack, CallStack::Frame{call_id, &info}),
      start_(util::SteadyClock::now()) {
}

void ActiveCall::Return(std::string return_text) {
  const auto end = util::SteadyClock::now();
  if (completed_ || !call_id_) return;
  completed_ = true;

  db::model::CallOutcome outcome;
  outcome.duration_ms  = util::ElapsedMillis(start_, end);
  outcome.return_value = Truncate(std::move(return_text));
  recorder_.RecordCompletion(*call_id_, outcome);
}

void ActiveCall::Raise() {
  const auto end = util::SteadyClock::now();
  if (completed_ || !call_id_) return;
  completed_ = true;

  auto error = DescribeCurrentException(stack_);

  db::model::CallOutcome outcome;
  outcome.duration_ms       = util::ElapsedMillis(start_, end);
  outcome.exception_type    = std::move(error.type);
  outcome.exception_message = std::move(error.message);
  outcome.tb                = std::move(error.traceback);
  recorder_.RecordCompletion(*call_id_, outcome);
}

// ------------------------------------------------------------
// CallRecorder
// ------------------------------------------------------------

CallRecorder::CallRecorder(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<int64_t> CallRecorder::RegisterFunction(const FunctionInfo& info) {
  const FunctionKey key{info.module, info.qualname, info.filename, info.lineno};

  // held across the store round trip: one lookup+insert per identity
  std::lock_guard lock(registry_mutex_);
  if (auto it = registry_.find(key); it != registry_.end()) {
    return it->second;
  }

  try {
    auto tx     = repository_->Begin();
    auto record = info.ToRecord();
    auto result = repository_->GetOrCreateFunction(*tx, record);
    if (!result) {
      ReportStoreFailure("register_function", std::string(db::ToString(result.code)) + ": " + result.message);
      return std::nullopt;
    }
    tx->Commit();

    registry_.emplace(key, record.id);
    return record.id;
  } catch (const std::exception& e) {
    ReportStoreFailure("register_function", e.what());
    return std::nullopt;
  }
}

std::optional<int64_t> CallRecorder::ResolveFunction(const FunctionInfo& info, std::atomic<int64_t>& function_id) {
  if (const auto cached = function_id.load(std::memory_order_acquire); cached != 0) {
    return cached;
  }

  auto id = RegisterFunction(info);
  if (id) {
    function_id.store(*id, std::memory_order_release);
  }
  return id;
}

std::optional<int64_t> CallRecorder::RecordEntry(const FunctionInfo& info, int64_t function_id, std::optional<int64_t> parent,
                                                 const std::optional<std::string>& class_name,
                                                 std::vector<db::model::ArgumentRecord> arguments) {
  db::model::CallRecord call;
  call.function_id    = function_id;
  call.parent_call_id = parent;
  call.timestamp      = util::ToUnixSeconds(util::Now());
  call.thread_id      = CurrentThreadId();
  call.is_coroutine   = info.is_coroutine;
  call.method_type    = ToString(info.kind);
  call.class_name     = class_name;

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->InsertCall(*tx, call);
    if (!result) {
      ReportStoreFailure("insert_call", std::string(db::ToString(result.code)) + ": " + result.message);
      return std::nullopt;
    }

    for (auto& argument : arguments) {
      argument.call_id = call.id;
    }
    result = repository_->InsertArguments(*tx, arguments);
    if (!result) {
      ReportStoreFailure("insert_arguments", std::string(db::ToString(result.code)) + ": " + result.message);
      return std::nullopt;
    }

    tx->Commit();
    return call.id;
  } catch (const std::exception& e) {
    ReportStoreFailure("insert_call", e.what());
    return std::nullopt;
  }
}

void CallRecorder::RecordCompletion(int64_t call_id, const db::model::CallOutcome& outcome) {
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->CompleteCall(*tx, call_id, outcome);
    if (!result) {
      ReportStoreFailure("complete_call", std::string(db::ToString(result.code)) + ": " + result.message);
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    ReportStoreFailure("complete_call", e.what());
  }
}

db::model::ArgumentRecord CallRecorder::MakeArgument(const FunctionInfo& info, std::size_t index, std::string value) {
  db::model::ArgumentRecord argument;
  argument.name  = index < info.param_names.size() ? info.param_names[index] : "arg" + std::to_string(index);
  argument.value = std::move(value);
  return argument;
}

void CallRecorder::ReportSerializationFailure(const std::type_info& type, const char* detail) noexcept {
  const auto failures = ++serialization_failures_;
  try {
    CALLTRACE_LOG_WARN("value serialization failed",
                       {StringField("type", util::TypeName(type)), StringField("error", detail ? detail : ""),
                        IntField("failures", static_cast<int64_t>(failures))});
  } catch (const std::exception&) {
    // logging itself failed; the count above still records it
  }
}

void CallRecorder::ReportStoreFailure(const char* operation, const std::string& detail) {
  const auto failures = ++store_failures_;
  CALLTRACE_LOG_WARN("trace store write failed",
                     {StringField("operation", operation), StringField("error", detail), IntField("failures", static_cast<int64_t>(failures))});
}

} // namespace calltrace::trace
