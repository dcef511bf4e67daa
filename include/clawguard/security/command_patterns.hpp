#pragma once

#include "clawguard/common/result.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace clawguard::security {

struct BlockedPattern {
  std::string source;
  std::regex regex;
  std::string reason;
  std::string category;
};

struct PatternSet {
  std::vector<BlockedPattern> patterns;
  /// Commands that may appear after a `|` without counting as pipe-to-shell.
  std::vector<std::string> safe_pipe_targets;
  bool from_fallback = false;
};

[[nodiscard]] common::Result<BlockedPattern> compile_pattern(const std::string &source,
                                                             const std::string &reason,
                                                             const std::string &category,
                                                             bool icase = false);

[[nodiscard]] PatternSet fallback_command_patterns();
[[nodiscard]] common::Result<PatternSet> parse_pattern_set_json(const std::string &json);
/// Inverse of parse_pattern_set_json, pretty-printed.
[[nodiscard]] std::string pattern_set_to_json(const PatternSet &set);

/// Reads the JSON pattern file at `path`. A missing, unreadable or malformed file, or one
/// with a regex that does not compile, yields the built-in set and a config-fallback event.
[[nodiscard]] PatternSet load_command_patterns(const std::string &path);

[[nodiscard]] std::vector<std::string> default_exfiltration_sources();
/// Case-insensitive exfiltration patterns. Empty `sources` means the defaults; a source that
/// fails to compile replaces the whole list with the defaults.
[[nodiscard]] std::vector<BlockedPattern>
compile_exfiltration_patterns(const std::vector<std::string> &sources);

/// Replaces every single-quoted literal with `''`. Double quotes are left alone because the
/// shell still expands their contents.
[[nodiscard]] std::string strip_single_quoted(const std::string &command);

/// Splits on `&&`, `||` and `;`, and also on `|` when `include_pipes` is set.
[[nodiscard]] std::vector<std::string> split_command_segments(const std::string &command,
                                                              bool include_pipes);

/// First word of every stage after the first `|` in one segment.
[[nodiscard]] std::vector<std::string> pipe_targets(const std::string &segment);
[[nodiscard]] bool is_shell_interpreter(const std::string &program);
/// True only when the segment has pipe stages, each one is a safe target and the last one is
/// not an interpreter.
[[nodiscard]] bool pipe_chain_is_safe(const std::string &segment,
                                      const std::vector<std::string> &safe_targets);

[[nodiscard]] std::optional<BlockedPattern>
matches_blocked_pattern(const std::string &text, const std::vector<BlockedPattern> &patterns,
                        const std::vector<std::string> &safe_targets = {});

/// Pass one runs every pattern on the whole quote-stripped command so patterns that span
/// separators still fire; pass two runs them on each `&&`/`||`/`;` segment.
[[nodiscard]] std::optional<BlockedPattern> find_blocked_command(const std::string &command,
                                                                 const PatternSet &set);

/// A network-capable program at the start of any segment, including pipe stages.
[[nodiscard]] bool detect_network_command(const std::string &command);

} // namespace clawguard::security
