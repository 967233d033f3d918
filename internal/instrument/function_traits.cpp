#include "internal/instrument/function_traits.hpp"

#include <utility>

namespace calltrace::instrument {

std::string PrettyTypeName(std::string demangled) {
  static const std::pair<std::string, std::string> kAliases[] = {
      {"std::__cxx11::basic_string<char, std::char_traits<char>, std::allocator<char> >", "std::string"},
      {"std::basic_string<char, std::char_traits<char>, std::allocator<char> >", "std::string"},
      {"std::basic_string_view<char, std::char_traits<char> >", "std::string_view"},
      {"std::__cxx11::", "std::"},
      {"(anonymous namespace)::", ""},
  };

  for (const auto& [from, to] : kAliases) {
    for (auto pos = demangled.find(from); pos != std::string::npos; pos = demangled.find(from, pos + to.size())) {
      demangled.replace(pos, from.size(), to);
    }
  }
  return demangled;
}

} // namespace calltrace::instrument
