#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace calltrace::instrument {

/*
  Line-oriented view of one C++ source file.

  Searches run over a masked copy of the text in which comments and
  string / character literals are blanked, so names and braces inside
  them never match. Line numbers are 1-based.
*/
class SourceIndex {
 public:
  explicit SourceIndex(std::string text);

  // Throws util::InstrumentationError if the file cannot be read.
  static SourceIndex Read(const std::filesystem::path& path);

  /*
    Line of the definition of qualname, tried first fully qualified
    ("Service::process(") and then by its last component, which covers
    in-class definitions and lambdas bound to a name.
  */
  std::optional<int64_t> FindDefinition(const std::string& qualname) const;

  // From the start of `line` to the end of the line closing its body.
  std::optional<std::string> ExtractBody(int64_t line) const;

  std::size_t LineCount() const {
    return line_starts_.size();
  }

  const std::string& Text() const {
    return text_;
  }

 private:
  std::optional<int64_t> FindName(const std::string& name) const;
  bool                   IsDefinitionAt(std::size_t name_begin, std::size_t name_end) const;
  int64_t                LineOf(std::size_t offset) const;

  std::string              text_;
  std::string              masked_;
  std::vector<std::size_t> line_starts_;
};

} // namespace calltrace::instrument
