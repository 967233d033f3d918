#pragma once

#include <google/protobuf/struct.pb.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/util/type_name.hpp"

namespace calltrace::trace {

/*
  Textual encoding of argument and return values.

  Values are lowered into google::protobuf::Value and printed with the
  protobuf JSON printer, so the stored text is JSON wherever the value
  has a JSON shape:

    bool, integers, floating point  -> number / bool
    strings                          -> "quoted"
    optional / nullptr               -> null or the contained value
    sequences, pairs, tuples         -> [ ... ]
    maps                             -> { "key": ... }
    streamable (operator<<)          -> "streamed text"
    anything else                    -> "<TypeName object>"

  Specialize ValueFormatter<T> to control a type's encoding.
*/

// Stored text is cut to exactly this many characters (UTF-8 code points).
inline constexpr std::size_t kMaxValueChars = 1000;

template <typename T, typename Enable = void>
struct ValueFormatter {};

// Cuts after kMaxValueChars code points, never inside a multi-byte sequence.
std::string Truncate(std::string text);

// Valid UTF-8 copy of text; each byte that is not part of a well-formed
// sequence becomes the four characters \xNN.
std::string SanitizeUtf8(std::string_view text);

// JSON text of an encoded value; never throws.
std::string ValueToJson(const google::protobuf::Value& value);

namespace detail {

template <typename T, typename = void>
struct HasFormatter : std::false_type {};
template <typename T>
struct HasFormatter<T, std::void_t<decltype(ValueFormatter<T>::Encode(std::declval<const T&>(), nullptr))>>
    : std::true_type {};

template <typename T, typename = void>
struct IsStreamable : std::false_type {};
template <typename T>
struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T, typename = void>
struct IsMapLike : std::false_type {};
template <typename T>
struct IsMapLike<T, std::void_t<typename T::key_type, typename T::mapped_type,
                                decltype(std::begin(std::declval<const T&>()))>> : std::true_type {};

template <typename T, typename = void>
struct IsRange : std::false_type {};
template <typename T>
struct IsRange<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                              decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

template <typename T>
struct IsPair : std::false_type {};
template <typename A, typename B>
struct IsPair<std::pair<A, B>> : std::true_type {};

template <typename T>
struct IsTuple : std::false_type {};
template <typename... Ts>
struct IsTuple<std::tuple<Ts...>> : std::true_type {};

template <typename T>
inline constexpr bool kIsStringLike = std::is_convertible_v<const T&, std::string_view>;

// doubles hold integers exactly up to 2^53
inline constexpr double kMaxExactInteger = 9007199254740992.0;

} // namespace detail

template <typename T>
void EncodeValue(const T& v, google::protobuf::Value* out);

namespace detail {

void EncodeDouble(double v, google::protobuf::Value* out);

// Repairs strings a ValueFormatter specialization set without sanitizing.
void SanitizeTree(google::protobuf::Value* value);

template <typename T>
void EncodeInteger(T v, google::protobuf::Value* out) {
  if (static_cast<double>(v) > kMaxExactInteger || static_cast<double>(v) < -kMaxExactInteger) {
    out->set_string_value(std::to_string(v));
    return;
  }
  out->set_number_value(static_cast<double>(v));
}

inline void SetString(google::protobuf::Value* out, std::string_view text) {
  out->set_string_value(SanitizeUtf8(text));
}

template <typename T>
std::string KeyText(const T& key) {
  if constexpr (kIsStringLike<T>) {
    return SanitizeUtf8(std::string_view(key));
  } else {
    google::protobuf::Value encoded;
    EncodeValue(key, &encoded);
    if (encoded.kind_case() == google::protobuf::Value::kStringValue) return encoded.string_value();
    return ValueToJson(encoded);
  }
}

template <typename Tuple, std::size_t... I>
void EncodeTuple(const Tuple& t, google::protobuf::Value* out, std::index_sequence<I...>) {
  auto* list = out->mutable_list_value();
  (EncodeValue(std::get<I>(t), list->add_values()), ...);
}

} // namespace detail

template <typename T>
void EncodeValue(const T& v, google::protobuf::Value* out) {
  using U = std::decay_t<T>;

  if constexpr (detail::HasFormatter<U>::value) {
    ValueFormatter<U>::Encode(v, out);
  } else if constexpr (std::is_same_v<U, bool>) {
    out->set_bool_value(v);
  } else if constexpr (std::is_same_v<U, char>) {
    detail::SetString(out, std::string_view(&v, 1));
  } else if constexpr (std::is_integral_v<U>) {
    detail::EncodeInteger(v, out);
  } else if constexpr (std::is_floating_point_v<U>) {
    detail::EncodeDouble(static_cast<double>(v), out);
  } else if constexpr (std::is_enum_v<U>) {
    detail::EncodeInteger(static_cast<std::underlying_type_t<U>>(v), out);
  } else if constexpr (std::is_null_pointer_v<U> || std::is_same_v<U, std::nullopt_t>) {
    out->set_null_value(google::protobuf::NULL_VALUE);
  } else if constexpr (std::is_pointer_v<U> && detail::kIsStringLike<U>) {
    if (v == nullptr) {
      out->set_null_value(google::protobuf::NULL_VALUE);
    } else {
      detail::SetString(out, v);
    }
  } else if constexpr (std::is_same_v<U, std::filesystem::path>) {
    detail::SetString(out, v.string());
  } else if constexpr (detail::kIsStringLike<U>) {
    detail::SetString(out, std::string_view(v));
  } else if constexpr (detail::IsOptional<U>::value) {
    if (v) {
      EncodeValue(*v, out);
    } else {
      out->set_null_value(google::protobuf::NULL_VALUE);
    }
  } else if constexpr (detail::IsPair<U>::value) {
    auto* list = out->mutable_list_value();
    EncodeValue(v.first, list->add_values());
    EncodeValue(v.second, list->add_values());
  } else if constexpr (detail::IsTuple<U>::value) {
    detail::EncodeTuple(v, out, std::make_index_sequence<std::tuple_size_v<U>>{});
  } else if constexpr (detail::IsMapLike<U>::value) {
    auto* fields = out->mutable_struct_value()->mutable_fields();
    for (const auto& [key, mapped] : v) {
      EncodeValue(mapped, &(*fields)[detail::KeyText(key)]);
    }
  } else if constexpr (detail::IsRange<U>::value) {
    auto* list = out->mutable_list_value();
    for (const auto& item : v) {
      EncodeValue(item, list->add_values());
    }
  } else if constexpr (detail::IsStreamable<U>::value) {
    std::ostringstream text;
    text << v;
    detail::SetString(out, text.str());
  } else {
    out->set_string_value("<" + util::TypeName<U>() + " object>");
  }
}

// Serialized, truncated text of a value.
template <typename T>
std::string ToText(const T& v) {
  google::protobuf::Value encoded;
  EncodeValue(v, &encoded);
  detail::SanitizeTree(&encoded);
  return Truncate(ValueToJson(encoded));
}

// Serialized, truncated JSON object of name -> text pairs (metadata columns).
std::string ToJsonObject(const std::vector<std::pair<std::string, std::string>>& entries);

// Serialized JSON list of text items.
std::string ToJsonList(const std::vector<std::string>& items);

} // namespace calltrace::trace
