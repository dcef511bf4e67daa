#include "clawguard/config/config.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/common/toml.hpp"
#include "clawguard/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace clawguard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".clawguard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CLAWGUARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::size_t get_size(const common::TomlDocument &doc, const std::string &key,
                     const std::size_t fallback) {
  return static_cast<std::size_t>(doc.get_u64(key, fallback));
}

void load_thresholds(ThresholdConfig &thresholds, const common::TomlDocument &doc,
                     const std::string &section) {
  ThresholdConfig loaded;
  loaded.sensitivity = doc.get_double(section + ".sensitivity", thresholds.sensitivity);
  loaded.warn_threshold = doc.get_double(section + ".warn_threshold", thresholds.warn_threshold);
  loaded.block_threshold = doc.get_double(section + ".block_threshold", thresholds.block_threshold);

  if (const auto status = validate_thresholds(loaded); !status.ok()) {
    observability::record_config_fallback(section, status.error());
    return;
  }
  thresholds = loaded;
}

void load_network_guard(NetworkGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("network_guard.enabled", guard.enabled);
  guard.guarded_tools = doc.get_string_array("network_guard.guarded_tools", guard.guarded_tools);
  guard.allowed_domains =
      doc.get_string_array("network_guard.allowed_domains", guard.allowed_domains);
  guard.blocked_patterns =
      doc.get_string_array("network_guard.blocked_patterns", guard.blocked_patterns);
  guard.block_direct_ip = doc.get_bool("network_guard.block_direct_ip", guard.block_direct_ip);
  guard.resolve_dns = doc.get_bool("network_guard.resolve_dns", guard.resolve_dns);
  guard.dns_timeout_ms = doc.get_u64("network_guard.dns_timeout_ms", guard.dns_timeout_ms);
  guard.fail_open = doc.get_bool("network_guard.fail_open", guard.fail_open);
  guard.log_blocks = doc.get_bool("network_guard.log_blocks", guard.log_blocks);

  for (const auto &agent : doc.child_keys("network_guard.agent_overrides")) {
    guard.agent_overrides[agent] =
        doc.get_string_array("network_guard.agent_overrides." + agent);
  }
}

void load_command_guard(CommandGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("command_guard.enabled", guard.enabled);
  guard.guarded_tools = doc.get_string_array("command_guard.guarded_tools", guard.guarded_tools);
  guard.patterns_file =
      expand_config_value(doc.get_string("command_guard.patterns_file", guard.patterns_file));
  guard.fail_open = doc.get_bool("command_guard.fail_open", guard.fail_open);
  guard.log_blocks = doc.get_bool("command_guard.log_blocks", guard.log_blocks);
}

void load_file_guard(FileGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("file_guard.enabled", guard.enabled);
  guard.guarded_tools = doc.get_string_array("file_guard.guarded_tools", guard.guarded_tools);
  guard.protection_file =
      expand_config_value(doc.get_string("file_guard.protection_file", guard.protection_file));
  guard.self_protect = doc.get_bool("file_guard.self_protect", guard.self_protect);
  guard.fail_open = doc.get_bool("file_guard.fail_open", guard.fail_open);
  guard.log_blocks = doc.get_bool("file_guard.log_blocks", guard.log_blocks);

  for (const auto &agent : doc.child_keys("file_guard.agent_overrides")) {
    guard.agent_overrides[agent] =
        expand_config_value(doc.get_string("file_guard.agent_overrides." + agent));
  }
}

void load_web_guard(WebGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("web_guard.enabled", guard.enabled);
  load_thresholds(guard.thresholds, doc, "web_guard");
  guard.max_content_length =
      get_size(doc, "web_guard.max_content_length", guard.max_content_length);
  guard.timeout_ms = doc.get_u64("web_guard.timeout_ms", guard.timeout_ms);
  guard.max_redirects = get_size(doc, "web_guard.max_redirects", guard.max_redirects);
  guard.fail_open = doc.get_bool("web_guard.fail_open", guard.fail_open);
  guard.log_detections = doc.get_bool("web_guard.log_detections", guard.log_detections);
}

void load_agent_guard(AgentGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("agent_guard.enabled", guard.enabled);
  load_thresholds(guard.thresholds, doc, "agent_guard");
  guard.guard_agents = doc.get_string_array("agent_guard.guard_agents", guard.guard_agents);
  guard.skip_target_agents =
      doc.get_string_array("agent_guard.skip_target_agents", guard.skip_target_agents);
  guard.max_content_length =
      get_size(doc, "agent_guard.max_content_length", guard.max_content_length);
  guard.fail_open = doc.get_bool("agent_guard.fail_open", guard.fail_open);
  guard.log_detections = doc.get_bool("agent_guard.log_detections", guard.log_detections);
}

void load_channel_guard(ChannelGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("channel_guard.enabled", guard.enabled);
  load_thresholds(guard.thresholds, doc, "channel_guard");
  guard.channels = doc.get_string_array("channel_guard.channels", guard.channels);
  guard.max_content_length =
      get_size(doc, "channel_guard.max_content_length", guard.max_content_length);
  guard.fail_open = doc.get_bool("channel_guard.fail_open", guard.fail_open);
  guard.log_detections = doc.get_bool("channel_guard.log_detections", guard.log_detections);
}

void load_content_guard(ContentGuardConfig &guard, const common::TomlDocument &doc) {
  guard.enabled = doc.get_bool("content_guard.enabled", guard.enabled);
  guard.api_url = doc.get_string("content_guard.api_url", guard.api_url);
  guard.model = doc.get_string("content_guard.model", guard.model);
  if (doc.has("content_guard.api_key")) {
    guard.api_key = expand_config_value(doc.get_string("content_guard.api_key"));
  }
  guard.timeout_ms = doc.get_u64("content_guard.timeout_ms", guard.timeout_ms);
  guard.max_content_length =
      get_size(doc, "content_guard.max_content_length", guard.max_content_length);
  guard.session_prefix = doc.get_string("content_guard.session_prefix", guard.session_prefix);
  load_thresholds(guard.thresholds, doc, "content_guard");
  guard.log_detections = doc.get_bool("content_guard.log_detections", guard.log_detections);
}

Config config_from_document(const common::TomlDocument &doc) {
  Config config;
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  config.classifier.endpoint =
      expand_config_value(doc.get_string("classifier.endpoint", config.classifier.endpoint));
  config.classifier.model = doc.get_string("classifier.model", config.classifier.model);
  config.classifier.injection_label =
      doc.get_string("classifier.injection_label", config.classifier.injection_label);
  config.classifier.timeout_ms = doc.get_u64("classifier.timeout_ms", config.classifier.timeout_ms);
  config.classifier.chunk_size = get_size(doc, "classifier.chunk_size", config.classifier.chunk_size);

  load_network_guard(config.network_guard, doc);
  load_command_guard(config.command_guard, doc);
  load_file_guard(config.file_guard, doc);
  load_web_guard(config.web_guard, doc);
  load_agent_guard(config.agent_guard, doc);
  load_channel_guard(config.channel_guard, doc);
  load_content_guard(config.content_guard, doc);
  return config;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

void write_thresholds(std::ostream &out, const ThresholdConfig &thresholds) {
  out << "sensitivity = " << thresholds.sensitivity << "\n";
  out << "warn_threshold = " << thresholds.warn_threshold << "\n";
  out << "block_threshold = " << thresholds.block_threshold << "\n";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), common::ErrorKind::Config);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.kind());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Status validate_thresholds(const ThresholdConfig &thresholds) {
  const auto in_unit_range = [](const double value) { return value >= 0.0 && value <= 1.0; };
  if (!in_unit_range(thresholds.sensitivity) || !in_unit_range(thresholds.warn_threshold) ||
      !in_unit_range(thresholds.block_threshold)) {
    return common::Status::error("thresholds must be within [0, 1]", common::ErrorKind::Config);
  }
  if (thresholds.warn_threshold >= thresholds.block_threshold) {
    return common::Status::error("warn_threshold must be lower than block_threshold",
                                 common::ErrorKind::Config);
  }
  return common::Status::success();
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("CLAWGUARD_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (const char *endpoint = std::getenv("CLAWGUARD_CLASSIFIER_ENDPOINT");
      endpoint != nullptr && *endpoint) {
    config.classifier.endpoint = endpoint;
  }

  if (config.content_guard.api_key.has_value() &&
      !common::trim(*config.content_guard.api_key).empty()) {
    return;
  }
  if (const char *api_key = std::getenv("OPENROUTER_API_KEY"); api_key != nullptr && *api_key) {
    config.content_guard.api_key = std::string(api_key);
  }
}

common::Result<Config> load_config_from_string(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), common::ErrorKind::Config);
  }
  return common::Result<Config>::success(config_from_document(parsed.value()));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), common::ErrorKind::Config);
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorKind::Config);
  }

  auto loaded = load_config_from_string(content.value());
  if (!loaded.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + loaded.error(),
                                           common::ErrorKind::Config);
  }

  Config config = std::move(loaded.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path_result = config_path();
  if (!path_result.ok()) {
    return common::Status::error(path_result.error(), common::ErrorKind::Config);
  }
  const auto path = path_result.value();
  if (const auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    return common::Status::error(dir.error(), common::ErrorKind::Config);
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Status::error("Unable to write config file: " + path.string(),
                                 common::ErrorKind::Config);
  }

  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n\n";

  out << "[classifier]\n";
  out << "endpoint = " << common::quote_toml_string(config.classifier.endpoint) << "\n";
  out << "model = " << common::quote_toml_string(config.classifier.model) << "\n";
  out << "injection_label = " << common::quote_toml_string(config.classifier.injection_label)
      << "\n";
  out << "timeout_ms = " << config.classifier.timeout_ms << "\n";
  out << "chunk_size = " << config.classifier.chunk_size << "\n\n";

  const auto &network = config.network_guard;
  out << "[network_guard]\n";
  out << "enabled = " << bool_to_toml(network.enabled) << "\n";
  out << "guarded_tools = " << string_array_to_toml(network.guarded_tools) << "\n";
  out << "allowed_domains = " << string_array_to_toml(network.allowed_domains) << "\n";
  if (!network.blocked_patterns.empty()) {
    out << "blocked_patterns = " << string_array_to_toml(network.blocked_patterns) << "\n";
  }
  out << "block_direct_ip = " << bool_to_toml(network.block_direct_ip) << "\n";
  out << "resolve_dns = " << bool_to_toml(network.resolve_dns) << "\n";
  out << "dns_timeout_ms = " << network.dns_timeout_ms << "\n";
  out << "fail_open = " << bool_to_toml(network.fail_open) << "\n";
  out << "log_blocks = " << bool_to_toml(network.log_blocks) << "\n\n";
  if (!network.agent_overrides.empty()) {
    out << "[network_guard.agent_overrides]\n";
    for (const auto &[agent, patterns] : network.agent_overrides) {
      out << common::quote_toml_string(agent) << " = " << string_array_to_toml(patterns) << "\n";
    }
    out << "\n";
  }

  const auto &command = config.command_guard;
  out << "[command_guard]\n";
  out << "enabled = " << bool_to_toml(command.enabled) << "\n";
  out << "guarded_tools = " << string_array_to_toml(command.guarded_tools) << "\n";
  out << "patterns_file = " << common::quote_toml_string(command.patterns_file) << "\n";
  out << "fail_open = " << bool_to_toml(command.fail_open) << "\n";
  out << "log_blocks = " << bool_to_toml(command.log_blocks) << "\n\n";

  const auto &file = config.file_guard;
  out << "[file_guard]\n";
  out << "enabled = " << bool_to_toml(file.enabled) << "\n";
  out << "guarded_tools = " << string_array_to_toml(file.guarded_tools) << "\n";
  out << "protection_file = " << common::quote_toml_string(file.protection_file) << "\n";
  out << "self_protect = " << bool_to_toml(file.self_protect) << "\n";
  out << "fail_open = " << bool_to_toml(file.fail_open) << "\n";
  out << "log_blocks = " << bool_to_toml(file.log_blocks) << "\n\n";
  if (!file.agent_overrides.empty()) {
    out << "[file_guard.agent_overrides]\n";
    for (const auto &[agent, override_path] : file.agent_overrides) {
      out << common::quote_toml_string(agent) << " = "
          << common::quote_toml_string(override_path) << "\n";
    }
    out << "\n";
  }

  const auto &web = config.web_guard;
  out << "[web_guard]\n";
  out << "enabled = " << bool_to_toml(web.enabled) << "\n";
  write_thresholds(out, web.thresholds);
  out << "max_content_length = " << web.max_content_length << "\n";
  out << "timeout_ms = " << web.timeout_ms << "\n";
  out << "max_redirects = " << web.max_redirects << "\n";
  out << "fail_open = " << bool_to_toml(web.fail_open) << "\n";
  out << "log_detections = " << bool_to_toml(web.log_detections) << "\n\n";

  const auto &agent = config.agent_guard;
  out << "[agent_guard]\n";
  out << "enabled = " << bool_to_toml(agent.enabled) << "\n";
  write_thresholds(out, agent.thresholds);
  out << "guard_agents = " << string_array_to_toml(agent.guard_agents) << "\n";
  out << "skip_target_agents = " << string_array_to_toml(agent.skip_target_agents) << "\n";
  out << "max_content_length = " << agent.max_content_length << "\n";
  out << "fail_open = " << bool_to_toml(agent.fail_open) << "\n";
  out << "log_detections = " << bool_to_toml(agent.log_detections) << "\n\n";

  const auto &channel = config.channel_guard;
  out << "[channel_guard]\n";
  out << "enabled = " << bool_to_toml(channel.enabled) << "\n";
  write_thresholds(out, channel.thresholds);
  out << "channels = " << string_array_to_toml(channel.channels) << "\n";
  out << "max_content_length = " << channel.max_content_length << "\n";
  out << "fail_open = " << bool_to_toml(channel.fail_open) << "\n";
  out << "log_detections = " << bool_to_toml(channel.log_detections) << "\n\n";

  // The API key is never written back; it comes from the environment.
  const auto &content = config.content_guard;
  out << "[content_guard]\n";
  out << "enabled = " << bool_to_toml(content.enabled) << "\n";
  out << "api_url = " << common::quote_toml_string(content.api_url) << "\n";
  out << "model = " << common::quote_toml_string(content.model) << "\n";
  out << "timeout_ms = " << content.timeout_ms << "\n";
  out << "max_content_length = " << content.max_content_length << "\n";
  out << "session_prefix = " << common::quote_toml_string(content.session_prefix) << "\n";
  write_thresholds(out, content.thresholds);
  out << "log_detections = " << bool_to_toml(content.log_detections) << "\n";

  if (!out) {
    return common::Status::error("Failed writing config file: " + path.string(),
                                 common::ErrorKind::Config);
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::pair<const char *, const ThresholdConfig *> thresholds[] = {
      {"web_guard", &config.web_guard.thresholds},
      {"agent_guard", &config.agent_guard.thresholds},
      {"channel_guard", &config.channel_guard.thresholds},
      {"content_guard", &config.content_guard.thresholds},
  };
  for (const auto &[section, values] : thresholds) {
    if (const auto status = validate_thresholds(*values); !status.ok()) {
      return common::Result<std::vector<std::string>>::failure(
          std::string(section) + ": " + status.error(), common::ErrorKind::Config);
    }
  }

  if (config.classifier.chunk_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "classifier.chunk_size must be greater than zero", common::ErrorKind::Config);
  }

  if (config.web_guard.max_redirects > 20) {
    return common::Result<std::vector<std::string>>::failure(
        "web_guard.max_redirects must not exceed 20", common::ErrorKind::Config);
  }

  if (config.network_guard.enabled && config.network_guard.allowed_domains.empty()) {
    warnings.push_back("network_guard.allowed_domains is empty: every domain will be blocked");
  }

  if (config.network_guard.enabled && !config.network_guard.resolve_dns) {
    warnings.push_back("network_guard.resolve_dns is disabled: DNS rebinding is not checked");
  }

  const std::pair<const char *, bool> fail_open[] = {
      {"network_guard", config.network_guard.fail_open},
      {"command_guard", config.command_guard.fail_open},
      {"file_guard", config.file_guard.fail_open},
      {"web_guard", config.web_guard.fail_open},
      {"agent_guard", config.agent_guard.fail_open},
      {"channel_guard", config.channel_guard.fail_open},
  };
  for (const auto &[section, enabled] : fail_open) {
    if (enabled) {
      warnings.push_back(std::string(section) + ".fail_open is enabled: errors will allow calls");
    }
  }

  if (config.content_guard.enabled &&
      (!config.content_guard.api_key.has_value() ||
       common::trim(*config.content_guard.api_key).empty())) {
    warnings.push_back("content_guard is enabled without an API key: search-session messages "
                       "will be blocked");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace clawguard::config
