#include "clawguard/security/file_protection.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/common/json_util.hpp"
#include "clawguard/observability/global.hpp"

#include <algorithm>
#include <array>

namespace clawguard::security {

namespace {

namespace fs = std::filesystem;

const std::array<const char *, 5> kReadCommands = {"cat", "head", "tail", "less", "more"};
const std::array<const char *, 4> kGrepCommands = {"grep", "egrep", "fgrep", "rg"};
const std::array<const char *, 3> kDeleteCommands = {"rm", "unlink", "shred"};
const std::array<const char *, 2> kCopyMoveCommands = {"cp", "mv"};

template <std::size_t N>
bool contains_name(const std::array<const char *, N> &names, const std::string &value) {
  return std::find(names.begin(), names.end(), value) != names.end();
}

void append_unique(std::vector<std::string> &target, const std::vector<std::string> &extra) {
  for (const auto &entry : extra) {
    if (std::find(target.begin(), target.end(), entry) == target.end()) {
      target.push_back(entry);
    }
  }
}

std::string strip_quotes(const std::string &value) {
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::string escape_regex_char(const char ch) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  if (special.find(ch) != std::string::npos) {
    return std::string("\\") + ch;
  }
  return std::string(1, ch);
}

bool is_flag(const std::string &token) {
  static const std::regex flag_re("^-[a-zA-Z0-9]+$");
  return std::regex_match(token, flag_re);
}

std::vector<std::string> positional_args(const std::vector<std::string> &tokens) {
  std::vector<std::string> args;
  bool after_dashes = false;
  for (const auto &token : tokens) {
    if (!after_dashes && token == "--") {
      after_dashes = true;
      continue;
    }
    if (!after_dashes && (is_flag(token) || common::starts_with(token, "--"))) {
      continue;
    }
    args.push_back(strip_quotes(token));
  }
  return args;
}

std::vector<std::string> tokenize(const std::string &text) {
  static const std::regex token_re(R"re((?:[^\s"']+|"[^"]*"|'[^']*')+)re");
  std::vector<std::string> tokens;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), token_re);
       it != std::sregex_iterator(); ++it) {
    tokens.push_back(it->str());
  }
  return tokens;
}

void classify_stage(const std::string &stage, ExtractedPaths &out) {
  static const std::regex redirect_out_re(R"(>{1,2}\s*(\S+))");
  static const std::regex redirect_in_re(R"(<\s*(\S+))");
  static const std::regex sed_expr_re(R"(^[sy]/.*/.*/)");

  for (auto it = std::sregex_iterator(stage.begin(), stage.end(), redirect_out_re);
       it != std::sregex_iterator(); ++it) {
    const std::string target = strip_quotes((*it)[1].str());
    // `2>&1` names a descriptor, not a file.
    if (!target.empty() && target.front() != '&') {
      out.writes.push_back(target);
    }
  }
  for (auto it = std::sregex_iterator(stage.begin(), stage.end(), redirect_in_re);
       it != std::sregex_iterator(); ++it) {
    out.reads.push_back(strip_quotes((*it)[1].str()));
  }

  std::string cleaned = std::regex_replace(stage, redirect_out_re, "");
  cleaned = std::regex_replace(cleaned, redirect_in_re, "");
  const auto tokens = tokenize(common::trim(cleaned));
  if (tokens.empty()) {
    return;
  }

  const std::string program = fs::path(strip_quotes(tokens.front())).filename().string();
  const std::vector<std::string> rest(tokens.begin() + 1, tokens.end());

  if (contains_name(kDeleteCommands, program)) {
    const auto args = positional_args(rest);
    out.deletes.insert(out.deletes.end(), args.begin(), args.end());
  } else if (contains_name(kCopyMoveCommands, program)) {
    const auto args = positional_args(rest);
    if (args.size() >= 2) {
      out.reads.insert(out.reads.end(), args.begin(), args.end() - 1);
      out.writes.push_back(args.back());
    } else if (args.size() == 1) {
      out.reads.push_back(args.front());
    }
  } else if (program == "sed") {
    const bool in_place = std::any_of(rest.begin(), rest.end(), [](const std::string &token) {
      return common::starts_with(token, "-i");
    });
    for (const auto &arg : positional_args(rest)) {
      if (std::regex_search(arg, sed_expr_re)) {
        continue;
      }
      (in_place ? out.writes : out.reads).push_back(arg);
    }
  } else if (program == "tee") {
    const auto args = positional_args(rest);
    out.writes.insert(out.writes.end(), args.begin(), args.end());
  } else if (contains_name(kGrepCommands, program)) {
    // The first positional argument is the search pattern.
    const auto args = positional_args(rest);
    if (args.size() > 1) {
      out.reads.insert(out.reads.end(), args.begin() + 1, args.end());
    }
  } else if (contains_name(kReadCommands, program)) {
    const auto args = positional_args(rest);
    out.reads.insert(out.reads.end(), args.begin(), args.end());
  }
}

std::vector<std::string> level_patterns(const std::string &levels_json, const std::string &name) {
  const std::string level = common::json_get_object(levels_json, name);
  if (level.empty()) {
    return {};
  }
  return common::json_get_string_array(level, "patterns");
}

} // namespace

std::string_view protection_level_name(const ProtectionLevel level) {
  switch (level) {
  case ProtectionLevel::NoAccess:
    return "no_access";
  case ProtectionLevel::ReadOnly:
    return "read_only";
  case ProtectionLevel::NoDelete:
    return "no_delete";
  }
  return "no_access";
}

bool level_denies(const ProtectionLevel level, const FileAccess access) {
  switch (level) {
  case ProtectionLevel::NoAccess:
    return true;
  case ProtectionLevel::ReadOnly:
    return access != FileAccess::Read;
  case ProtectionLevel::NoDelete:
    return access == FileAccess::Delete;
  }
  return true;
}

std::string PathMatch::label() const {
  return self_protection ? "self-protection" : std::string(protection_level_name(level));
}

FileProtectionConfig default_file_protection() {
  return FileProtectionConfig{
      .no_access = {"**/.env", "**/.env.*", "**/.ssh/*", "**/.aws/credentials", "**/.aws/config",
                    "**/credentials.json", "**/credentials.yaml", "**/*.pem", "**/*.key",
                    "**/.kube/config", "**/secrets.yml", "**/secrets.yaml"},
      .read_only = {"**/package-lock.json", "**/yarn.lock", "**/pnpm-lock.yaml", "**/Cargo.lock",
                    "**/poetry.lock", "**/go.sum"},
      .no_delete = {"**/.git/*", "**/LICENSE", "**/README.md"},
  };
}

common::Result<FileProtectionConfig> parse_file_protection_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<FileProtectionConfig>::failure("protection file is not a JSON object",
                                                         common::ErrorKind::Config);
  }
  const std::string levels = common::json_get_object(trimmed, "protection_levels");
  if (levels.empty()) {
    return common::Result<FileProtectionConfig>::failure(
        "protection file has no 'protection_levels' object", common::ErrorKind::Config);
  }
  return common::Result<FileProtectionConfig>::success(FileProtectionConfig{
      .no_access = level_patterns(levels, "no_access"),
      .read_only = level_patterns(levels, "read_only"),
      .no_delete = level_patterns(levels, "no_delete"),
  });
}

std::string file_protection_to_json(const FileProtectionConfig &config) {
  const auto level = [](const std::string &name, const std::vector<std::string> &patterns) {
    std::string out = "    \"" + name + "\": {\"patterns\": [";
    for (std::size_t i = 0; i < patterns.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += "\"" + common::json_escape(patterns[i]) + "\"";
    }
    return out + "]}";
  };
  return "{\n  \"protection_levels\": {\n" + level("no_access", config.no_access) + ",\n" +
         level("read_only", config.read_only) + ",\n" + level("no_delete", config.no_delete) +
         "\n  }\n}\n";
}

FileProtectionConfig load_file_protection(const std::string &path) {
  const fs::path location = common::expand_path(path);
  std::error_code ec;
  if (!fs::exists(location, ec)) {
    return default_file_protection();
  }
  const auto content = common::read_text_file(location);
  if (!content.ok()) {
    observability::record_config_fallback("file_guard",
                                          content.error() + "; using default protection rules");
    return default_file_protection();
  }
  auto parsed = parse_file_protection_json(content.value());
  if (!parsed.ok()) {
    observability::record_config_fallback("file_guard", location.string() + ": " + parsed.error() +
                                                            "; using default protection rules");
    return default_file_protection();
  }
  return std::move(parsed.value());
}

std::optional<FileProtectionConfig> load_file_protection_override(const std::string &path) {
  const auto content = common::read_text_file(common::expand_path(path));
  if (!content.ok()) {
    observability::record_config_fallback("file_guard", content.error() + "; override ignored");
    return std::nullopt;
  }
  auto parsed = parse_file_protection_json(content.value());
  if (!parsed.ok()) {
    observability::record_config_fallback("file_guard", path + ": " + parsed.error() +
                                                            "; override ignored");
    return std::nullopt;
  }
  return std::move(parsed.value());
}

FileProtectionConfig merge_file_protection(const FileProtectionConfig &base,
                                           const FileProtectionConfig &extra) {
  FileProtectionConfig merged = base;
  append_unique(merged.no_access, extra.no_access);
  append_unique(merged.read_only, extra.read_only);
  append_unique(merged.no_delete, extra.no_delete);
  return merged;
}

std::regex path_glob_to_regex(const std::string &pattern) {
  std::string expr = "^";
  std::size_t i = 0;
  while (i < pattern.size()) {
    if (pattern.compare(i, 3, "**/") == 0) {
      expr += "(?:.*/)?";
      i += 3;
    } else if (pattern.compare(i, 3, "/**") == 0 && i + 3 == pattern.size()) {
      expr += "(?:/.*)?";
      i += 3;
    } else if (pattern.compare(i, 2, "**") == 0) {
      expr += ".*";
      i += 2;
    } else if (pattern[i] == '*') {
      expr += "[^/]*";
      ++i;
    } else if (pattern[i] == '?') {
      expr += "[^/]";
      ++i;
    } else {
      expr += escape_regex_char(pattern[i]);
      ++i;
    }
  }
  expr += '$';
  return std::regex(expr, std::regex::ECMAScript);
}

std::vector<std::string> split_shell_command(const std::string &command) {
  std::vector<std::string> parts;
  std::string current;
  bool in_single = false;
  bool in_double = false;

  const auto flush = [&] {
    const std::string part = common::trim(current);
    if (!part.empty()) {
      parts.push_back(part);
    }
    current.clear();
  };

  for (std::size_t i = 0; i < command.size(); ++i) {
    const char ch = command[i];
    const char next = i + 1 < command.size() ? command[i + 1] : '\0';

    if (ch == '\'' && !in_double) {
      in_single = !in_single;
    } else if (ch == '"' && !in_single) {
      in_double = !in_double;
    } else if (!in_single && !in_double) {
      if (ch == ';') {
        flush();
        continue;
      }
      if ((ch == '&' && next == '&') || (ch == '|' && next == '|')) {
        flush();
        ++i;
        continue;
      }
      if (ch == '|') {
        flush();
        continue;
      }
    }
    current += ch;
  }
  flush();
  return parts;
}

ExtractedPaths extract_paths_from_command(const std::string &command) {
  ExtractedPaths paths;
  for (const auto &stage : split_shell_command(command)) {
    classify_stage(stage, paths);
  }
  return paths;
}

std::vector<std::string> extract_paths_from_patch(const std::string &patch) {
  static const std::regex header_re(R"(^(?:---|\+\+\+)\s+[ab]/(.+)$)");
  std::vector<std::string> paths;
  std::size_t start = 0;
  while (start <= patch.size()) {
    auto end = patch.find('\n', start);
    if (end == std::string::npos) {
      end = patch.size();
    }
    std::string line = patch.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::smatch match;
    if (std::regex_match(line, match, header_re)) {
      const std::string path = match[1].str();
      if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
        paths.push_back(path);
      }
    }
    start = end + 1;
  }
  return paths;
}

FileProtector::FileProtector(const FileProtectionConfig &config,
                             const std::vector<fs::path> &self_protected) {
  const auto add_level = [this](const ProtectionLevel level,
                                const std::vector<std::string> &patterns) {
    if (patterns.empty()) {
      return;
    }
    Level entry{.level = level, .patterns = patterns, .regexes = {}};
    for (const auto &pattern : patterns) {
      entry.regexes.push_back(path_glob_to_regex(pattern));
    }
    levels_.push_back(std::move(entry));
  };
  add_level(ProtectionLevel::NoAccess, config.no_access);
  add_level(ProtectionLevel::ReadOnly, config.read_only);
  add_level(ProtectionLevel::NoDelete, config.no_delete);

  for (const auto &location : self_protected) {
    std::vector<fs::path> forms = {location.lexically_normal()};
    std::error_code ec;
    const auto canonical = fs::weakly_canonical(location, ec);
    if (!ec && canonical != forms.front()) {
      forms.push_back(canonical);
    }
    for (const auto &form : forms) {
      std::string text = form.string();
      while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
      }
      std::string escaped;
      for (const char ch : text) {
        escaped += escape_regex_char(ch);
      }
      self_patterns_.push_back(text);
      self_regexes_.emplace_back("^" + escaped + "(?:/.*)?$", std::regex::ECMAScript);
    }
  }
}

std::optional<PathMatch> FileProtector::match_level(const Level &level,
                                                    const std::vector<std::string> &forms) const {
  for (const auto &form : forms) {
    for (std::size_t i = 0; i < level.regexes.size(); ++i) {
      if (std::regex_match(form, level.regexes[i])) {
        return PathMatch{.level = level.level, .pattern = level.patterns[i], .self_protection = false};
      }
    }
  }
  return std::nullopt;
}

std::optional<PathMatch> FileProtector::match_path(const std::string &path, const fs::path &cwd,
                                                   const bool include_self) const {
  if (common::trim(path).empty()) {
    return std::nullopt;
  }

  const fs::path absolute = common::absolute_from(path, cwd);
  std::optional<fs::path> resolved;
  std::error_code ec;
  if (fs::exists(absolute, ec)) {
    auto canonical = fs::canonical(absolute, ec);
    if (!ec) {
      resolved = std::move(canonical);
    }
  }

  if (include_self) {
    for (std::size_t i = 0; i < self_regexes_.size(); ++i) {
      if (std::regex_match(absolute.string(), self_regexes_[i]) ||
          (resolved.has_value() && std::regex_match(resolved->string(), self_regexes_[i]))) {
        return PathMatch{
            .level = ProtectionLevel::NoAccess, .pattern = self_patterns_[i], .self_protection = true};
      }
    }
  }

  std::vector<std::string> forms = {absolute.string()};
  const auto relative = absolute.lexically_relative(cwd.lexically_normal()).string();
  if (!relative.empty()) {
    forms.push_back(relative);
  }
  if (resolved.has_value() && *resolved != absolute) {
    forms.push_back(resolved->string());
  }

  for (const auto &level : levels_) {
    if (auto match = match_level(level, forms)) {
      return match;
    }
  }
  return std::nullopt;
}

std::optional<PathMatch> FileProtector::check_access(const std::string &path,
                                                     const FileAccess access,
                                                     const fs::path &cwd) const {
  const bool include_self = access != FileAccess::Read;
  auto match = match_path(path, cwd, include_self);
  if (!match.has_value()) {
    return std::nullopt;
  }
  if (match->self_protection || level_denies(match->level, access)) {
    return match;
  }
  return std::nullopt;
}

std::optional<SensitiveAction>
FileProtector::detect_sensitive_action(const std::string &command, const fs::path &cwd) const {
  const auto paths = extract_paths_from_command(command);
  const std::array<std::pair<const std::vector<std::string> *, FileAccess>, 3> groups = {{
      {&paths.reads, FileAccess::Read},
      {&paths.writes, FileAccess::Write},
      {&paths.deletes, FileAccess::Delete},
  }};
  for (const auto &[group, access] : groups) {
    for (const auto &path : *group) {
      if (auto match = check_access(path, access, cwd)) {
        return SensitiveAction{.path = path, .access = access, .match = std::move(*match)};
      }
    }
  }
  return std::nullopt;
}

} // namespace clawguard::security
