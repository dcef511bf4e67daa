#include "clawguard/common/toml.hpp"

#include "clawguard/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <locale>
#include <set>
#include <sstream>

namespace clawguard::common {

namespace {

// Tracks which quote style, if any, the scanner is inside. Literal strings ('...') have no
// escapes; basic strings ("...") honour backslash escapes.
struct QuoteState {
  char quote = '\0';
  bool escaped = false;

  // Returns true while `ch` is part of a quoted string.
  bool advance(const char ch) {
    if (quote == '\0') {
      if (ch == '"' || ch == '\'') {
        quote = ch;
        return true;
      }
      return false;
    }
    if (quote == '"' && escaped) {
      escaped = false;
      return true;
    }
    if (quote == '"' && ch == '\\') {
      escaped = true;
      return true;
    }
    if (ch == quote) {
      quote = '\0';
    }
    return true;
  }
};

std::string strip_comment(const std::string &line) {
  QuoteState state;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    const bool quoted = state.advance(ch);
    if (!quoted && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  QuoteState state;

  for (const char ch : array_value) {
    const bool quoted = state.advance(ch);
    if (!quoted && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }

  return result;
}

std::string decode_basic_string(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  bool escaped = false;
  for (const char ch : body) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return decode_basic_string(value.substr(1, value.size() - 2));
  }
  return value;
}

bool brackets_balanced(const std::string &value) {
  QuoteState state;
  int depth = 0;
  for (const char ch : value) {
    if (state.advance(ch)) {
      continue;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
  }
  return depth <= 0;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  int parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }

  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = trim(it->second);
  std::istringstream stream(normalized);
  stream.imbue(std::locale::classic());
  double parsed = 0.0;
  stream >> parsed;
  if (stream.fail() || !stream.eof()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  const std::string body = raw.substr(1, raw.size() - 2);
  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(body)) {
    if (!element.empty()) {
      values_out.push_back(unquote(element));
    }
  }

  return values_out;
}

std::vector<std::string> TomlDocument::child_keys(const std::string &prefix) const {
  const std::string dotted = prefix + ".";
  std::set<std::string> names;
  for (const auto &[key, value] : values) {
    if (!starts_with(key, dotted)) {
      continue;
    }
    const std::string rest = key.substr(dotted.size());
    if (!rest.empty() && rest.find('.') == std::string::npos) {
      names.insert(rest);
    }
  }
  return {names.begin(), names.end()};
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  // Multi-line arrays are accumulated until their brackets close.
  std::string pending_key;
  std::string pending_value;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));

    if (!pending_key.empty()) {
      pending_value += " " + clean_line;
      if (brackets_balanced(pending_value)) {
        document.values[pending_key] = pending_value;
        pending_key.clear();
        pending_value.clear();
      }
      continue;
    }

    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::Config);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(
          "Invalid key/value at line " + std::to_string(line_number), ErrorKind::Config);
    }

    std::string key = unquote(trim(clean_line.substr(0, equals_index)));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::Config);
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (!value.empty() && value.front() == '[' && !brackets_balanced(value)) {
      pending_key = full_key;
      pending_value = value;
      continue;
    }
    document.values[full_key] = value;
  }

  if (!pending_key.empty()) {
    return Result<TomlDocument>::failure("Unterminated array for key " + pending_key,
                                         ErrorKind::Config);
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace clawguard::common
