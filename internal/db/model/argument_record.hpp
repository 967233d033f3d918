#pragma once

#include <cstdint>
#include <string>

namespace calltrace::db::model {

// One bound parameter of a call, fixed at call entry.
struct ArgumentRecord {
  int64_t     id      = 0;
  int64_t     call_id = 0;
  std::string name;
  std::string value;
};

// Argument joined with its owning call.
struct ArgumentWithCall {
  ArgumentRecord argument;
  int64_t        function_id = 0;
  double         timestamp   = 0.0;
};

} // namespace calltrace::db::model
