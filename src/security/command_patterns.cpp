#include "clawguard/security/command_patterns.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/common/json_util.hpp"
#include "clawguard/observability/global.hpp"

#include <algorithm>
#include <array>

namespace clawguard::security {

namespace {

struct PatternSpec {
  const char *regex;
  const char *reason;
  const char *category;
};

const std::array<PatternSpec, 17> kFallbackPatterns = {{
    {R"(\brm\s+(-[a-zA-Z]*r[a-zA-Z]*\s+-[a-zA-Z]*f[a-zA-Z]*|(-[a-zA-Z]*f[a-zA-Z]*\s+-[a-zA-Z]*r[a-zA-Z]*)|(-[a-zA-Z]*rf[a-zA-Z]*)|(-[a-zA-Z]*fr[a-zA-Z]*))\b)",
     "Recursive force delete blocked.", "destructive"},
    {R"(\bsudo\s+rm\b)", "sudo rm blocked.", "destructive"},
    {R"(:\(\)\{\s*:\|:&\s*\}\s*;\s*:)", "Fork bomb blocked.", "system_damage"},
    {R"(\bchmod\s+777\b)", "chmod 777 blocked.", "system_damage"},
    {R"(\bdd\s+.*if=.*of=/dev/)", "dd to device blocked.", "system_damage"},
    {R"(\bmkfs\.)", "Filesystem format blocked.", "system_damage"},
    {R"(>\s*/dev/sd)", "Direct write to block device blocked.", "system_damage"},
    {R"(\b(curl|wget)\b.*\|\s*(sh|bash|zsh|dash|ksh|python|python3|perl|ruby|node)\b)",
     "Pipe-to-shell blocked.", "pipe_to_shell"},
    {R"(\bgit\s+push\s+.*(-f\b|--force\b|--force-with-lease\b))", "Git force push blocked.",
     "git_destructive"},
    {R"(\bgit\s+reset\s+--hard\b)", "git reset --hard blocked.", "git_destructive"},
    {R"(\bgit\s+branch\s+-D\b)", "git branch -D blocked.", "git_destructive"},
    {R"(\bgit\s+config\s+--global\s+(?!--get\b))", "git config --global write blocked.",
     "git_destructive"},
    {R"(\bgit\s+rebase\s+--skip\b)", "git rebase --skip blocked.", "git_destructive"},
    {R"(\bgit\s+clean\s+-[a-zA-Z]*f[a-zA-Z]*(?!.*-n)(?!.*--dry-run))", "git clean -f blocked.",
     "git_destructive"},
    {R"(\b(bash|sh|zsh|dash|ksh)\s+-c\s+["'])", "Shell interpreter escape blocked.",
     "interpreter_escape"},
    {R"(\beval\s+["'])", "eval blocked.", "interpreter_escape"},
    {R"(\b(python3?|node|ruby|perl)\s+-(c|e)\s+["'])", "Interpreter inline execution blocked.",
     "interpreter_escape"},
}};

const std::array<const char *, 11> kSafePipeTargets = {
    "jq", "grep", "sort", "wc", "head", "tail", "less", "cat", "tee", "tr", "uniq"};

const std::array<const char *, 10> kExfiltrationPatterns = {
    R"(curl.*\|\s*sh)",
    R"(wget.*\|\s*sh)",
    R"(\|\s*curl\s+.*-X\s+POST)",
    R"(\|\s*curl\s+.*-XPOST)",
    R"(\|\s*curl\s+.*--request\s+POST)",
    R"(curl\s+.*-d\s+)",
    R"(curl\s+.*--data)",
    R"(curl\s+.*-F\s+)",
    R"(base64\s+-d)",
    R"(echo.*\|.*base64)",
};

const std::array<const char *, 11> kInterpreters = {
    "sh", "bash", "zsh", "dash", "ksh", "python", "python3", "perl", "ruby", "node", "fish"};

const std::array<const char *, 12> kNetworkCommands = {
    "curl", "wget", "fetch", "nc", "ncat", "socat", "http", "ssh", "scp", "rsync", "telnet", "openssl"};

const std::array<const char *, 8> kNetworkCompoundCommands = {
    R"(git\s+clone)",    R"(git\s+fetch)",    R"(git\s+pull)",   R"(git\s+push)",
    R"(pip\s+install)",  R"(npm\s+install)",  R"(docker\s+pull)", R"(openssl\s+s_client)",
};

std::string program_name(const std::string &word) {
  const auto slash = word.find_last_of('/');
  return slash == std::string::npos ? word : word.substr(slash + 1);
}

// std::regex has no dotAll mode; folding line breaks lets `.*` span a multi-line command.
std::string fold_newlines(std::string text) {
  std::replace(text.begin(), text.end(), '\n', ' ');
  std::replace(text.begin(), text.end(), '\r', ' ');
  return text;
}

bool pattern_fires(const std::string &text, const BlockedPattern &pattern,
                   const std::vector<std::string> &safe_targets) {
  if (!std::regex_search(text, pattern.regex)) {
    return false;
  }
  if (pattern.category == "pipe_to_shell" && pipe_chain_is_safe(text, safe_targets)) {
    return false;
  }
  return true;
}

} // namespace

common::Result<BlockedPattern> compile_pattern(const std::string &source, const std::string &reason,
                                               const std::string &category, const bool icase) {
  try {
    auto flags = std::regex::ECMAScript;
    if (icase) {
      flags |= std::regex::icase;
    }
    return common::Result<BlockedPattern>::success(BlockedPattern{
        .source = source, .regex = std::regex(source, flags), .reason = reason, .category = category});
  } catch (const std::regex_error &e) {
    return common::Result<BlockedPattern>::failure("invalid pattern '" + source + "': " + e.what(),
                                                   common::ErrorKind::Config);
  }
}

PatternSet fallback_command_patterns() {
  PatternSet set;
  set.from_fallback = true;
  for (const auto &spec : kFallbackPatterns) {
    auto compiled = compile_pattern(spec.regex, spec.reason, spec.category);
    if (compiled.ok()) {
      set.patterns.push_back(std::move(compiled.value()));
    }
  }
  set.safe_pipe_targets.assign(kSafePipeTargets.begin(), kSafePipeTargets.end());
  return set;
}

common::Result<PatternSet> parse_pattern_set_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<PatternSet>::failure("pattern file is not a JSON object",
                                               common::ErrorKind::Config);
  }
  const std::string patterns_json = common::json_get_array(trimmed, "patterns");
  const std::string targets_json = common::json_get_array(trimmed, "safe_pipe_targets");
  if (patterns_json.empty() || targets_json.empty()) {
    return common::Result<PatternSet>::failure(
        "pattern file needs 'patterns' and 'safe_pipe_targets' arrays", common::ErrorKind::Config);
  }

  PatternSet set;
  for (const auto &entry : common::json_split_array(patterns_json)) {
    const std::string regex = common::json_get_string(entry, "regex");
    if (regex.empty()) {
      return common::Result<PatternSet>::failure("pattern entry without 'regex'",
                                                 common::ErrorKind::Config);
    }
    auto message = common::json_get_string(entry, "message");
    if (message.empty()) {
      message = "Blocked command pattern.";
    }
    auto category = common::json_get_string(entry, "category");
    if (category.empty()) {
      category = "uncategorized";
    }
    auto compiled = compile_pattern(regex, message, category);
    if (!compiled.ok()) {
      return common::Result<PatternSet>::failure(compiled.error(), common::ErrorKind::Config);
    }
    set.patterns.push_back(std::move(compiled.value()));
  }
  set.safe_pipe_targets = common::json_string_elements(targets_json);
  return common::Result<PatternSet>::success(std::move(set));
}

std::string pattern_set_to_json(const PatternSet &set) {
  std::string out = "{\n  \"patterns\": [\n";
  for (std::size_t i = 0; i < set.patterns.size(); ++i) {
    const auto &pattern = set.patterns[i];
    out += "    {\"regex\": \"" + common::json_escape(pattern.source) + "\", \"message\": \"" +
           common::json_escape(pattern.reason) + "\", \"category\": \"" +
           common::json_escape(pattern.category) + "\"}";
    out += i + 1 < set.patterns.size() ? ",\n" : "\n";
  }
  out += "  ],\n  \"safe_pipe_targets\": [";
  for (std::size_t i = 0; i < set.safe_pipe_targets.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "\"" + common::json_escape(set.safe_pipe_targets[i]) + "\"";
  }
  out += "]\n}\n";
  return out;
}

PatternSet load_command_patterns(const std::string &path) {
  const auto content = common::read_text_file(common::expand_path(path));
  if (!content.ok()) {
    observability::record_config_fallback("command_guard",
                                          content.error() + "; using built-in patterns");
    return fallback_command_patterns();
  }
  auto parsed = parse_pattern_set_json(content.value());
  if (!parsed.ok()) {
    observability::record_config_fallback("command_guard",
                                          parsed.error() + "; using built-in patterns");
    return fallback_command_patterns();
  }
  return std::move(parsed.value());
}

std::vector<std::string> default_exfiltration_sources() {
  return {kExfiltrationPatterns.begin(), kExfiltrationPatterns.end()};
}

std::vector<BlockedPattern> compile_exfiltration_patterns(const std::vector<std::string> &sources) {
  const auto defaults = default_exfiltration_sources();
  const auto &selected = sources.empty() ? defaults : sources;

  std::vector<BlockedPattern> patterns;
  for (const auto &source : selected) {
    auto compiled = compile_pattern(source, "potential data exfiltration", "exfiltration", true);
    if (!compiled.ok()) {
      observability::record_config_fallback("network_guard",
                                            compiled.error() + "; using built-in patterns");
      return compile_exfiltration_patterns({});
    }
    patterns.push_back(std::move(compiled.value()));
  }
  return patterns;
}

std::string strip_single_quoted(const std::string &command) {
  static const std::regex quoted_re("'[^']*'");
  return std::regex_replace(command, quoted_re, "''");
}

std::vector<std::string> split_command_segments(const std::string &command,
                                                const bool include_pipes) {
  static const std::regex logical_re(R"(\s*(?:&&|\|\||;)\s*)");
  static const std::regex with_pipes_re(R"(\s*(?:&&|\|\||[;|])\s*)");
  const std::regex &separator = include_pipes ? with_pipes_re : logical_re;

  std::vector<std::string> segments;
  for (std::sregex_token_iterator it(command.begin(), command.end(), separator, -1), end; it != end;
       ++it) {
    const std::string segment = common::trim(it->str());
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

std::vector<std::string> pipe_targets(const std::string &segment) {
  std::vector<std::string> targets;
  std::size_t start = segment.find('|');
  while (start != std::string::npos) {
    const std::size_t next = segment.find('|', start + 1);
    const std::string stage =
        segment.substr(start + 1, next == std::string::npos ? std::string::npos : next - start - 1);
    const auto words = common::split_whitespace(stage);
    if (!words.empty()) {
      targets.push_back(program_name(words.front()));
    }
    start = next;
  }
  return targets;
}

bool is_shell_interpreter(const std::string &program) {
  return std::find(kInterpreters.begin(), kInterpreters.end(), program) != kInterpreters.end();
}

bool pipe_chain_is_safe(const std::string &segment, const std::vector<std::string> &safe_targets) {
  const auto targets = pipe_targets(segment);
  if (targets.empty()) {
    return false;
  }
  if (is_shell_interpreter(targets.back())) {
    return false;
  }
  return std::all_of(targets.begin(), targets.end(), [&](const std::string &target) {
    return std::find(safe_targets.begin(), safe_targets.end(), target) != safe_targets.end();
  });
}

std::optional<BlockedPattern> matches_blocked_pattern(const std::string &text,
                                                      const std::vector<BlockedPattern> &patterns,
                                                      const std::vector<std::string> &safe_targets) {
  const std::string folded = fold_newlines(text);
  for (const auto &pattern : patterns) {
    if (pattern_fires(folded, pattern, safe_targets)) {
      return pattern;
    }
  }
  return std::nullopt;
}

std::optional<BlockedPattern> find_blocked_command(const std::string &command,
                                                   const PatternSet &set) {
  const std::string stripped = strip_single_quoted(command);
  if (auto hit = matches_blocked_pattern(stripped, set.patterns, set.safe_pipe_targets)) {
    return hit;
  }
  for (const auto &segment : split_command_segments(stripped, false)) {
    if (auto hit = matches_blocked_pattern(segment, set.patterns, set.safe_pipe_targets)) {
      return hit;
    }
  }
  return std::nullopt;
}

bool detect_network_command(const std::string &command) {
  static const std::regex simple_re = [] {
    std::string expr = R"(^\s*(?:)";
    for (std::size_t i = 0; i < kNetworkCommands.size(); ++i) {
      expr += (i == 0 ? "" : "|") + std::string(kNetworkCommands[i]);
    }
    return std::regex(expr + R"()\b)");
  }();
  static const std::regex compound_re = [] {
    std::string expr = R"(^\s*(?:)";
    for (std::size_t i = 0; i < kNetworkCompoundCommands.size(); ++i) {
      expr += (i == 0 ? "" : "|") + std::string(kNetworkCompoundCommands[i]);
    }
    return std::regex(expr + R"()\b)");
  }();

  const std::string stripped = strip_single_quoted(command);
  for (const auto &segment : split_command_segments(stripped, true)) {
    if (std::regex_search(segment, simple_re) || std::regex_search(segment, compound_re)) {
      return true;
    }
  }
  return false;
}

} // namespace clawguard::security
