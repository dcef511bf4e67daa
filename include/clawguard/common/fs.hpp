#pragma once

#include "clawguard/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace clawguard::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] std::vector<std::string> split_whitespace(const std::string &value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Lexically normalized absolute form of `path`, resolved against `base` when relative.
/// `~` is expanded. The filesystem is not consulted.
[[nodiscard]] std::filesystem::path absolute_from(const std::string &path,
                                                  const std::filesystem::path &base);

} // namespace clawguard::common
