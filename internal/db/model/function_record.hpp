#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace calltrace::db::model {

/*
  Identity of a traced callable.

  IMPORTANT:
  - Deduplicated by (module, qualname, filename, lineno).
  - Immutable once inserted; never deleted within a run.
  - Optional columns hold serialized text (JSON-style), not structured data.
*/

struct FunctionRecord {
  int64_t id = 0; // assigned by the store

  std::string module;
  std::string qualname;
  std::string filename;
  int64_t     lineno = 0;

  std::string signature;

  std::optional<std::string> annotations;
  std::optional<std::string> defaults;
  std::optional<std::string> kwdefaults;
  std::optional<std::string> closure_vars;
  std::optional<std::string> source_code;
};

} // namespace calltrace::db::model
