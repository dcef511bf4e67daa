#include "clawguard/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace clawguard::common {

namespace {

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

// End position (exclusive) of the JSON value starting at `pos`.
std::size_t json_value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  while (pos < json.size()) {
    const char c = json[pos];
    if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      break;
    }
    ++pos;
  }
  return pos;
}

template <typename Visitor> void for_each_member(const std::string &json, Visitor &&visit) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return;
  }
  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      return;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto value_end = json_value_end(json, pos);
    if (value_end == std::string::npos || value_end <= pos) {
      return;
    }
    if (!visit(key, pos, value_end)) {
      return;
    }
    pos = value_end;
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto code = parse_hex4(raw, i + 1);
      if (!code.has_value()) {
        out.push_back('u');
        break;
      }
      i += 4;
      std::uint32_t code_point = *code;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        if (auto low = parse_hex4(raw, i + 3);
            low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::size_t json_find_member_value(const std::string &json, const std::string &field) {
  std::size_t found = std::string::npos;
  for_each_member(json, [&](const std::string &key, std::size_t start, std::size_t) {
    if (key == field) {
      found = start;
      return false;
    }
    return true;
  });
  return found;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = json_find_member_value(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto pos = json_find_member_value(json, field);
  if (pos == std::string::npos) {
    return "";
  }
  const char ch = json[pos];
  if (ch != '-' && std::isdigit(static_cast<unsigned char>(ch)) == 0) {
    return "";
  }
  return json.substr(pos, json_value_end(json, pos) - pos);
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const auto pos = json_find_member_value(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  if (json.compare(pos, 4, "true") == 0) {
    return true;
  }
  if (json.compare(pos, 5, "false") == 0) {
    return false;
  }
  return std::nullopt;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto pos = json_find_member_value(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  return json.substr(pos, json_value_end(json, pos) - pos);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto pos = json_find_member_value(json, field);
  if (pos == std::string::npos || json[pos] != '[') {
    return "";
  }
  return json.substr(pos, json_value_end(json, pos) - pos);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  return json_string_elements(json_get_array(json, field));
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for_each_member(json, [&](const std::string &key, std::size_t start, std::size_t end) {
    if (json[start] == '"') {
      result[key] = json_unescape(json.substr(start + 1, end - start - 2));
    } else {
      result[key] = json.substr(start, end - start);
    }
    return true;
  });
  return result;
}

std::vector<std::string> json_split_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = json_value_end(array_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::vector<std::string> json_string_elements(const std::string &array_json) {
  std::vector<std::string> out;
  for (const auto &element : json_split_array(array_json)) {
    if (element.size() >= 2 && element.front() == '"') {
      out.push_back(json_unescape(element.substr(1, element.size() - 2)));
    }
  }
  return out;
}

} // namespace clawguard::common
