#include "internal/instrument/source_index.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string_view>

#include "internal/util/errors.hpp"

namespace calltrace::instrument {

namespace {

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Keywords that may precede a call expression but never a definition.
constexpr std::array<std::string_view, 10> kExpressionKeywords = {
    "return", "else", "case", "throw", "new", "delete", "co_return", "co_await", "co_yield", "sizeof",
};

// Blanks comments and literals; keeps newlines so offsets and lines match.
std::string Mask(const std::string& text) {
  std::string out = text;
  const auto  n   = text.size();
  std::size_t i   = 0;

  auto blank = [&](std::size_t from, std::size_t to) {
    for (std::size_t k = from; k < to && k < n; ++k) {
      if (out[k] != '\n') out[k] = ' ';
    }
  };

  while (i < n) {
    const char c = text[i];

    if (c == '/' && i + 1 < n && text[i + 1] == '/') {
      const auto end = text.find('\n', i);
      const auto to  = end == std::string::npos ? n : end;
      blank(i, to);
      i = to;
      continue;
    }

    if (c == '/' && i + 1 < n && text[i + 1] == '*') {
      const auto end = text.find("*/", i + 2);
      const auto to  = end == std::string::npos ? n : end + 2;
      blank(i, to);
      i = to;
      continue;
    }

    if (c == '"' && i > 0 && text[i - 1] == 'R') {
      // R"delim( ... )delim"
      const auto open = text.find('(', i);
      if (open != std::string::npos) {
        const auto delim = text.substr(i + 1, open - i - 1);
        const auto close = text.find(")" + delim + "\"", open);
        const auto to    = close == std::string::npos ? n : close + delim.size() + 2;
        blank(i + 1, to - 1);
        i = to;
        continue;
      }
    }

    if (c == '"' || (c == '\'' && !(i > 0 && std::isxdigit(static_cast<unsigned char>(text[i - 1])) &&
                                    !(i > 1 && (text[i - 2] == 'u' || text[i - 2] == 'U' || text[i - 2] == 'L'))))) {
      std::size_t j = i + 1;
      while (j < n && text[j] != c && text[j] != '\n') {
        if (text[j] == '\\') ++j;
        ++j;
      }
      blank(i + 1, j);
      i = j + 1;
      continue;
    }

    ++i;
  }
  return out;
}

} // namespace

SourceIndex::SourceIndex(std::string text) : text_(std::move(text)), masked_(Mask(text_)) {
  line_starts_.push_back(0);
  for (std::size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n' && i + 1 < text_.size()) line_starts_.push_back(i + 1);
  }
}

SourceIndex SourceIndex::Read(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InstrumentationError("cannot read source '" + path.string() + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw util::InstrumentationError("error reading source '" + path.string() + "'");
  }
  return SourceIndex(buffer.str());
}

int64_t SourceIndex::LineOf(std::size_t offset) const {
  const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  return static_cast<int64_t>(it - line_starts_.begin());
}

std::optional<int64_t> SourceIndex::FindDefinition(const std::string& qualname) const {
  if (qualname.empty()) return std::nullopt;

  if (auto line = FindName(qualname)) return line;

  const auto pos = qualname.rfind("::");
  if (pos == std::string::npos) return std::nullopt;
  return FindName(qualname.substr(pos + 2));
}

std::optional<int64_t> SourceIndex::FindName(const std::string& name) const {
  std::size_t from = 0;
  while (true) {
    const auto at = masked_.find(name, from);
    if (at == std::string::npos) return std::nullopt;
    from = at + 1;

    const auto end = at + name.size();
    if (at > 0 && (IsIdentChar(masked_[at - 1]) || masked_[at - 1] == '.')) continue;
    if (end < masked_.size() && IsIdentChar(masked_[end])) continue;
    // "a->add(" is a call
    if (at > 1 && masked_[at - 1] == '>' && masked_[at - 2] == '-') continue;

    if (IsDefinitionAt(at, end)) return LineOf(at);
  }
}

bool SourceIndex::IsDefinitionAt(std::size_t name_begin, std::size_t name_end) const {
  // something that reads as a declarator must precede the name
  std::size_t back = name_begin;
  while (back > 0 && std::isspace(static_cast<unsigned char>(masked_[back - 1]))) --back;
  if (back == 0) return false;

  const char before = masked_[back - 1];
  if (IsIdentChar(before)) {
    std::size_t word = back;
    while (word > 0 && IsIdentChar(masked_[word - 1])) --word;
    const std::string_view keyword(masked_.data() + word, back - word);
    if (std::find(kExpressionKeywords.begin(), kExpressionKeywords.end(), keyword) != kExpressionKeywords.end()) {
      return false;
    }
  } else if (before != '*' && before != '&' && before != '>' && before != ':') {
    return false;
  }
  // "a::b" reached by skipping "::" only counts when adjacent
  if (before == ':' && back != name_begin) return false;

  std::size_t i = name_end;
  while (i < masked_.size() && std::isspace(static_cast<unsigned char>(masked_[i]))) ++i;
  if (i >= masked_.size()) return false;

  if (masked_[i] == '=') {
    // named lambda: "auto name = [...](...) {"
    ++i;
    while (i < masked_.size() && std::isspace(static_cast<unsigned char>(masked_[i]))) ++i;
    if (i >= masked_.size() || masked_[i] != '[') return false;
  } else if (masked_[i] == '(') {
    int depth = 0;
    for (; i < masked_.size(); ++i) {
      if (masked_[i] == '(') ++depth;
      if (masked_[i] == ')' && --depth == 0) break;
    }
    if (i >= masked_.size()) return false;
    ++i;
  } else {
    return false;
  }

  // a body must open before the declaration ends
  for (; i < masked_.size(); ++i) {
    if (masked_[i] == '{') return true;
    if (masked_[i] == ';') return false;
  }
  return false;
}

std::optional<std::string> SourceIndex::ExtractBody(int64_t line) const {
  if (line < 1 || static_cast<std::size_t>(line) > line_starts_.size()) return std::nullopt;

  const auto begin = line_starts_[static_cast<std::size_t>(line - 1)];
  auto       open  = masked_.find('{', begin);
  if (open == std::string::npos) return std::nullopt;

  int         depth = 0;
  std::size_t i     = open;
  for (; i < masked_.size(); ++i) {
    if (masked_[i] == '{') ++depth;
    if (masked_[i] == '}' && --depth == 0) break;
  }
  if (i >= masked_.size()) return std::nullopt;

  auto end = text_.find('\n', i);
  if (end == std::string::npos) end = text_.size();
  return text_.substr(begin, end - begin);
}

} // namespace calltrace::instrument
