#include "internal/trace/value_formatter.hpp"

#include <google/protobuf/util/json_util.h>

namespace calltrace::trace {

namespace {

// The printer escapes '<' and '>' as \u003c / \u003e; stored text keeps them literal.
std::string UnescapeAngleBrackets(const std::string& json) {
  std::string out;
  out.reserve(json.size());
  for (std::size_t i = 0; i < json.size(); ++i) {
    if (json[i] != '\\' || i + 1 >= json.size()) {
      out += json[i];
      continue;
    }
    if (json.compare(i, 6, "\\u003c") == 0) {
      out += '<';
      i += 5;
    } else if (json.compare(i, 6, "\\u003e") == 0) {
      out += '>';
      i += 5;
    } else {
      out += json[i];
      out += json[i + 1];
      ++i;
    }
  }
  return out;
}

bool IsValidUtf8(const std::string& text) {
  return SanitizeUtf8(text).size() == text.size();
}

} // namespace

std::string Truncate(std::string text) {
  if (text.size() <= kMaxValueChars) return text;

  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    // continuation bytes belong to the preceding character
    if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
    if (chars == kMaxValueChars) {
      text.resize(i);
      break;
    }
    ++chars;
  }
  return text;
}

std::string SanitizeUtf8(std::string_view text) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto  lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 0;
    unsigned char low = 0x80, high = 0xBF; // allowed range of the second byte

    if (lead < 0x80) {
      length = 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) low = 0xA0;  // overlong
      if (lead == 0xED) high = 0x9F; // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) low = 0x90;  // overlong
      if (lead == 0xF4) high = 0x8F; // above U+10FFFF
    }

    bool valid = length != 0 && i + length <= text.size();
    for (std::size_t k = 1; valid && k < length; ++k) {
      const auto b = static_cast<unsigned char>(text[i + k]);
      valid        = k == 1 ? (b >= low && b <= high) : (b >= 0x80 && b <= 0xBF);
    }

    if (valid) {
      out.append(text.substr(i, length));
      i += length;
    } else {
      out += "\\x";
      out += kHex[lead >> 4];
      out += kHex[lead & 0x0F];
      ++i;
    }
  }
  return out;
}

std::string ValueToJson(const google::protobuf::Value& value) {
  // the JSON printer rejects an unset kind; treat it as null
  if (value.kind_case() == google::protobuf::Value::KIND_NOT_SET) {
    return "null";
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    return "<unserializable: " + std::string(status.message()) + ">";
  }
  return UnescapeAngleBrackets(json);
}

namespace detail {

void SanitizeTree(google::protobuf::Value* value) {
  switch (value->kind_case()) {
    case google::protobuf::Value::kStringValue:
      if (!IsValidUtf8(value->string_value())) {
        value->set_string_value(SanitizeUtf8(value->string_value()));
      }
      break;

    case google::protobuf::Value::kListValue:
      for (auto& item : *value->mutable_list_value()->mutable_values()) {
        SanitizeTree(&item);
      }
      break;

    case google::protobuf::Value::kStructValue: {
      auto*                    fields = value->mutable_struct_value()->mutable_fields();
      std::vector<std::string> bad_keys;
      for (auto& entry : *fields) {
        SanitizeTree(&entry.second);
        if (!IsValidUtf8(entry.first)) bad_keys.push_back(entry.first);
      }
      for (const auto& key : bad_keys) {
        auto field = std::move((*fields)[key]);
        fields->erase(key);
        (*fields)[SanitizeUtf8(key)] = std::move(field);
      }
      break;
    }

    default:
      break;
  }
}

void EncodeDouble(double v, google::protobuf::Value* out) {
  // JSON has no spelling for these
  if (std::isnan(v)) {
    out->set_string_value("NaN");
    return;
  }
  if (std::isinf(v)) {
    out->set_string_value(v > 0 ? "Infinity" : "-Infinity");
    return;
  }
  out->set_number_value(v);
}

} // namespace detail

std::string ToJsonObject(const std::vector<std::pair<std::string, std::string>>& entries) {
  google::protobuf::Value value;
  auto*                   fields = value.mutable_struct_value()->mutable_fields();
  for (const auto& [key, text] : entries) {
    (*fields)[SanitizeUtf8(key)].set_string_value(SanitizeUtf8(text));
  }
  return Truncate(ValueToJson(value));
}

std::string ToJsonList(const std::vector<std::string>& items) {
  google::protobuf::Value value;
  auto*                   list = value.mutable_list_value();
  for (const auto& item : items) {
    list->add_values()->set_string_value(SanitizeUtf8(item));
  }
  return Truncate(ValueToJson(value));
}

} // namespace calltrace::trace
