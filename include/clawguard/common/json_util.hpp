#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clawguard::common {

/// Escape a string for embedding inside a JSON string literal. Control characters are
/// emitted as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode a JSON string body, including \uXXXX escapes and surrogate pairs (to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Position of the value belonging to the top-level member `field` of the object `json`, or
/// npos. Only members of the outermost object are considered, so a nested key with the same
/// name does not shadow the one asked for.
[[nodiscard]] std::size_t json_find_member_value(const std::string &json,
                                                 const std::string &field);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<bool> json_get_bool(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Top-level members of an object. String values are decoded; objects, arrays, numbers and
/// literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Elements of a JSON array, each as raw JSON text.
[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

/// Decoded strings of a raw JSON array such as ["a","b"]; non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_string_elements(const std::string &array_json);

} // namespace clawguard::common
