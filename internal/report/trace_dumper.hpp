#pragma once

#include <filesystem>
#include <string>

#include "internal/db/api/repository.hpp"

namespace calltrace::report {

/*
  TraceDumper

  Renders a stored run as one text blob for human or LLM review:

    === Functions Metadata ===     one block per Function, with source
    === Call Execution Flow ===    depth-first walk of the call tree

  Roots and siblings are ordered by start timestamp, ties by id. A call
  whose parent row is missing is rendered as a root. Read-only; the
  same store always renders the same text.
*/
class TraceDumper {
 public:
  explicit TraceDumper(db::Repository& repository);

  std::string Render();

  // Calls that raised, one line each, in id order.
  std::string RenderExceptions();

  // Writes Render() to path, creating parent directories.
  void RenderToFile(const std::filesystem::path& path);

  // Writes RenderExceptions() to path, creating parent directories.
  void RenderExceptionsToFile(const std::filesystem::path& path);

 private:
  static void WriteFile(const std::filesystem::path& path, const std::string& text);

  db::Repository& repository_;
};

} // namespace calltrace::report
