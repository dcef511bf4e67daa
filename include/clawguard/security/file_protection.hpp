#pragma once

#include "clawguard/common/result.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace clawguard::security {

/// Declared in priority order; the first level whose patterns match a path wins.
enum class ProtectionLevel { NoAccess, ReadOnly, NoDelete };
enum class FileAccess { Read, Write, Delete };

[[nodiscard]] std::string_view protection_level_name(ProtectionLevel level);
[[nodiscard]] bool level_denies(ProtectionLevel level, FileAccess access);

struct FileProtectionConfig {
  std::vector<std::string> no_access;
  std::vector<std::string> read_only;
  std::vector<std::string> no_delete;
};

[[nodiscard]] FileProtectionConfig default_file_protection();
/// `{"protection_levels": {"no_access": {"patterns": [...]}, ...}}`. Unknown levels are ignored.
[[nodiscard]] common::Result<FileProtectionConfig> parse_file_protection_json(const std::string &json);
[[nodiscard]] std::string file_protection_to_json(const FileProtectionConfig &config);
/// Missing file: the defaults. Unreadable or malformed file: the defaults plus a
/// config-fallback event.
[[nodiscard]] FileProtectionConfig load_file_protection(const std::string &path);
/// Per-agent extra rules; nothing (and a config-fallback event) when the file cannot be used.
[[nodiscard]] std::optional<FileProtectionConfig> load_file_protection_override(const std::string &path);
/// Pattern union per level, base entries first.
[[nodiscard]] FileProtectionConfig merge_file_protection(const FileProtectionConfig &base,
                                                         const FileProtectionConfig &extra);

/// Glob with `**` spanning directories and `*`/`?` staying inside one path component.
[[nodiscard]] std::regex path_glob_to_regex(const std::string &pattern);

struct ExtractedPaths {
  std::vector<std::string> reads;
  std::vector<std::string> writes;
  std::vector<std::string> deletes;
};

/// Splits on `;`, `&&`, `||` and `|` outside quotes.
[[nodiscard]] std::vector<std::string> split_shell_command(const std::string &command);
[[nodiscard]] ExtractedPaths extract_paths_from_command(const std::string &command);
/// Unique paths named by `--- a/...` and `+++ b/...` headers.
[[nodiscard]] std::vector<std::string> extract_paths_from_patch(const std::string &patch);

struct PathMatch {
  ProtectionLevel level = ProtectionLevel::NoAccess;
  std::string pattern;
  bool self_protection = false;

  [[nodiscard]] std::string label() const;
};

struct SensitiveAction {
  std::string path;
  FileAccess access = FileAccess::Read;
  PathMatch match;

  /// Level name, or "self-protection".
  [[nodiscard]] std::string category() const { return match.label(); }
};

class FileProtector {
public:
  FileProtector(const FileProtectionConfig &config,
                const std::vector<std::filesystem::path> &self_protected);

  /// Highest-priority level matching `path` in its absolute, cwd-relative or symlink-resolved
  /// form. Self-protected locations are reported first when `include_self` is set.
  [[nodiscard]] std::optional<PathMatch> match_path(const std::string &path,
                                                    const std::filesystem::path &cwd,
                                                    bool include_self) const;

  /// The match that denies `access` to `path`, if any. Self-protection denies writes and
  /// deletes only.
  [[nodiscard]] std::optional<PathMatch> check_access(const std::string &path, FileAccess access,
                                                      const std::filesystem::path &cwd) const;

  /// First denied read, write or delete among the files a shell command touches.
  [[nodiscard]] std::optional<SensitiveAction>
  detect_sensitive_action(const std::string &command, const std::filesystem::path &cwd) const;

private:
  struct Level {
    ProtectionLevel level;
    std::vector<std::string> patterns;
    std::vector<std::regex> regexes;
  };

  [[nodiscard]] std::optional<PathMatch> match_level(const Level &level,
                                                     const std::vector<std::string> &forms) const;

  std::vector<Level> levels_;
  std::vector<std::string> self_patterns_;
  std::vector<std::regex> self_regexes_;
};

} // namespace clawguard::security
