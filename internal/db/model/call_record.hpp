#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace calltrace::db::model {

/*
  One invocation of a traced callable.

  Lifecycle:
    insert  -> identity, parent, timestamp, thread, kind (before the body runs)
    update  -> duration + outcome, exactly once (return OR exception)

  A row with no duration is a call that was still in flight when the
  trace stopped.
*/

inline constexpr const char* kMethodFunction = "function";
inline constexpr const char* kMethodInstance = "instancemethod";
inline constexpr const char* kMethodClass    = "classmethod";
inline constexpr const char* kMethodStatic   = "staticmethod";

struct CallRecord {
  int64_t id          = 0; // assigned by the store
  int64_t function_id = 0;

  std::optional<int64_t> parent_call_id;

  // unix seconds, microsecond resolution
  double timestamp = 0.0;

  std::optional<double> duration_ms;

  uint64_t thread_id    = 0;
  bool     is_coroutine = false;

  std::string                method_type = kMethodFunction;
  std::optional<std::string> class_name;

  std::optional<std::string> return_value;

  std::optional<std::string> exception_type;
  std::optional<std::string> exception_message;
  std::optional<std::string> tb;
};

/*
  Completion data for the single update of a call row.
*/
struct CallOutcome {
  double duration_ms = 0.0;

  std::optional<std::string> return_value;

  std::optional<std::string> exception_type;
  std::optional<std::string> exception_message;
  std::optional<std::string> tb;
};

// Call joined with its function identity.
struct CallWithFunction {
  CallRecord call;
  std::string module;
  std::string qualname;
};

} // namespace calltrace::db::model
