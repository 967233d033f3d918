#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/function_record.hpp"

namespace calltrace::trace {

enum class CallKind {
  kFunction,
  kInstanceMethod,
  kClassMethod,
  kStaticMethod,
};

const char* ToString(CallKind kind);

/*
  Everything known about a traced definition before it is called.

  Filled by the module at definition time; lineno and source_code are
  completed by the loader from the module's source file.
*/
struct FunctionInfo {
  std::string module;
  std::string qualname;
  std::string filename;
  int64_t     lineno = 0;

  std::string              signature;
  std::vector<std::string> param_names;

  std::optional<std::string> annotations;
  std::optional<std::string> defaults;
  std::optional<std::string> kwdefaults;
  std::optional<std::string> closure_vars;
  std::optional<std::string> source_code;

  CallKind    kind = CallKind::kFunction;
  std::string class_name; // declared owner for class/static methods
  bool        is_coroutine = false;

  // Unqualified name: "Service::process" -> "process".
  std::string Name() const;

  db::model::FunctionRecord ToRecord() const;
};

} // namespace calltrace::trace
