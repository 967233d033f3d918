#include "internal/trace/function_info.hpp"

#include "internal/db/model/call_record.hpp"

namespace calltrace::trace {

const char* ToString(CallKind kind) {
  switch (kind) {
    case CallKind::kFunction:
      return db::model::kMethodFunction;
    case CallKind::kInstanceMethod:
      return db::model::kMethodInstance;
    case CallKind::kClassMethod:
      return db::model::kMethodClass;
    case CallKind::kStaticMethod:
      return db::model::kMethodStatic;
  }
  return db::model::kMethodFunction;
}

std::string FunctionInfo::Name() const {
  const auto pos = qualname.rfind("::");
  if (pos == std::string::npos) return qualname;
  return qualname.substr(pos + 2);
}

db::model::FunctionRecord FunctionInfo::ToRecord() const {
  db::model::FunctionRecord record;
  record.module       = module;
  record.qualname     = qualname;
  record.filename     = filename;
  record.lineno       = lineno;
  record.signature    = signature;
  record.annotations  = annotations;
  record.defaults     = defaults;
  record.kwdefaults   = kwdefaults;
  record.closure_vars = closure_vars;
  record.source_code  = source_code;
  return record;
}

} // namespace calltrace::trace
