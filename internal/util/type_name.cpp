#include "type_name.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>

namespace calltrace::util {

std::string Demangle(const char* mangled) {
  if (!mangled) return {};

  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  if (status != 0 || !demangled) {
    return mangled;
  }
  return demangled.get();
}

std::string ShortTypeName(const std::string& qualified) {
  // skip template arguments when searching for the last scope separator
  int    depth = 0;
  size_t cut   = std::string::npos;
  for (size_t i = 0; i < qualified.size(); ++i) {
    const char c = qualified[i];
    if (c == '<') {
      ++depth;
    } else if (c == '>') {
      --depth;
    } else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':') {
      cut = i + 1;
      ++i;
    }
  }
  if (cut == std::string::npos) return qualified;
  return qualified.substr(cut + 1);
}

} // namespace calltrace::util
