#pragma once

#include <string>
#include <typeinfo>

namespace calltrace::util {

/*
  Demangled C++ type names.

  Used for exception kinds, class names of receivers and signature text.
  Falls back to the mangled name when the ABI demangler refuses it.
*/

std::string Demangle(const char* mangled);

inline std::string TypeName(const std::type_info& info) {
  return Demangle(info.name());
}

template <typename T>
std::string TypeName() {
  return Demangle(typeid(T).name());
}

// Last component of a qualified name: "ns::Outer::Inner" -> "Inner".
std::string ShortTypeName(const std::string& qualified);

} // namespace calltrace::util
