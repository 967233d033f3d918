#pragma once

#include <stdexcept>
#include <string>

namespace calltrace::util {

/*
  Central error types.

  Repository failures are reported as db::Result values instead;
  these cover the loader and the public wrapping API.
*/

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Source unreadable, or a module that cannot be classified.
class InstrumentationError : public std::runtime_error {
 public:
  explicit InstrumentationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace calltrace::util
