#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/util/type_name.hpp"

namespace calltrace::instrument {

/*
  Signature deduction for everything Module::Define accepts:
  function pointers, member function pointers (const / noexcept) and
  lambdas or other functors with a single operator().
*/

template <typename T>
struct FunctionTraits : FunctionTraits<decltype(&T::operator())> {
  // a functor's operator() is not a method of the traced program
  static constexpr bool kMember = false;
};

template <typename R, typename... A>
struct FunctionTraits<R (*)(A...)> {
  using Signature                 = R(A...);
  static constexpr bool kMember   = false;
  static constexpr bool kConst    = false;
  static constexpr std::size_t kArity = sizeof...(A);
};

template <typename R, typename... A>
struct FunctionTraits<R (*)(A...) noexcept> : FunctionTraits<R (*)(A...)> {};

template <typename R, typename... A>
struct FunctionTraits<R(A...)> : FunctionTraits<R (*)(A...)> {};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...)> {
  using Signature                 = R(A...);
  using Class                     = C;
  static constexpr bool kMember   = true;
  static constexpr bool kConst    = false;
  static constexpr std::size_t kArity = sizeof...(A);
};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...) const> : FunctionTraits<R (C::*)(A...)> {
  static constexpr bool kConst = true;
};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...) noexcept> : FunctionTraits<R (C::*)(A...)> {};

template <typename C, typename R, typename... A>
struct FunctionTraits<R (C::*)(A...) const noexcept> : FunctionTraits<R (C::*)(A...) const> {};

// Readable type spelling for signature text.
std::string PrettyTypeName(std::string demangled);

template <typename T>
std::string PrettyTypeName() {
  return PrettyTypeName(util::TypeName<T>());
}

template <typename Sig>
struct SignatureOf;

template <typename R, typename... A>
struct SignatureOf<R(A...)> {
  static constexpr std::size_t kArity = sizeof...(A);

  static std::vector<std::string> ParameterTypes() {
    return {TypeSpelling<A>()...};
  }

  static std::string ReturnType() {
    return TypeSpelling<R>();
  }

  // "(int a, int b) -> int"
  static std::string Text(const std::vector<std::string>& names) {
    const auto  types = ParameterTypes();
    std::string out   = "(";
    for (std::size_t i = 0; i < types.size(); ++i) {
      if (i) out += ", ";
      out += types[i];
      if (i < names.size() && !names[i].empty()) {
        out += " " + names[i];
      }
    }
    out += ") -> " + ReturnType();
    return out;
  }

 private:
  // typeid drops cv and reference qualifiers; put them back
  template <typename T>
  static std::string TypeSpelling() {
    using Bare = std::remove_cv_t<std::remove_reference_t<T>>;
    std::string spelled;
    if constexpr (std::is_void_v<T>) {
      return "void";
    } else {
      if (std::is_const_v<std::remove_reference_t<T>>) spelled = "const ";
      spelled += PrettyTypeName<Bare>();
      if (std::is_lvalue_reference_v<T>) spelled += "&";
      if (std::is_rvalue_reference_v<T>) spelled += "&&";
      return spelled;
    }
  }
};

} // namespace calltrace::instrument
