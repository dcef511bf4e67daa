#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace clawguard::config {

struct ObservabilityConfig {
  std::string backend = "log";
};

/// Per-guard classification thresholds. `sensitivity` gates the model's own INJECTION label;
/// `warn_threshold < block_threshold` split flagged scores into tiers.
struct ThresholdConfig {
  double sensitivity = 0.5;
  double warn_threshold = 0.4;
  double block_threshold = 0.8;
};

/// Local prompt-injection model, served over HTTP by an inference server that answers
/// `POST {"inputs": "..."}` with `[{"label": "...", "score": ...}]`.
struct ClassifierConfig {
  std::string endpoint = "http://127.0.0.1:8080/predict";
  std::string model = "protectai/deberta-v3-base-prompt-injection-v2";
  std::string injection_label = "INJECTION";
  std::uint64_t timeout_ms = 10000;
  std::size_t chunk_size = 1500;
};

struct NetworkGuardConfig {
  bool enabled = true;
  std::vector<std::string> guarded_tools = {"web_fetch", "exec"};
  std::vector<std::string> allowed_domains = {"github.com", "*.github.com",   "npmjs.org",
                                              "registry.npmjs.org", "pypi.org", "*.pypi.org",
                                              "api.anthropic.com"};
  /// Empty means the built-in exfiltration patterns.
  std::vector<std::string> blocked_patterns;
  std::unordered_map<std::string, std::vector<std::string>> agent_overrides;
  bool block_direct_ip = true;
  bool resolve_dns = true;
  std::uint64_t dns_timeout_ms = 2000;
  bool fail_open = false;
  bool log_blocks = true;
};

struct CommandGuardConfig {
  bool enabled = true;
  std::vector<std::string> guarded_tools = {"exec", "bash"};
  std::string patterns_file = "~/.clawguard/blocked-commands.json";
  bool fail_open = false;
  bool log_blocks = true;
};

struct FileGuardConfig {
  bool enabled = true;
  std::vector<std::string> guarded_tools = {"read", "write", "edit", "apply_patch", "exec", "bash"};
  std::string protection_file = "~/.clawguard/file-guard.json";
  /// agent id -> additional protection file merged over the base one.
  std::unordered_map<std::string, std::string> agent_overrides;
  bool self_protect = true;
  bool fail_open = false;
  bool log_blocks = true;
};

struct WebGuardConfig {
  bool enabled = true;
  // The warn threshold sits below sensitivity, so any flagged chunk blocks.
  ThresholdConfig thresholds{.sensitivity = 0.5, .warn_threshold = 0.3, .block_threshold = 0.5};
  std::size_t max_content_length = 50000;
  std::uint64_t timeout_ms = 10000;
  std::size_t max_redirects = 5;
  bool fail_open = false;
  bool log_detections = true;
};

struct AgentGuardConfig {
  bool enabled = true;
  ThresholdConfig thresholds;
  std::vector<std::string> guard_agents;
  std::vector<std::string> skip_target_agents;
  std::size_t max_content_length = 50000;
  bool fail_open = false;
  bool log_detections = true;
};

struct ChannelGuardConfig {
  bool enabled = true;
  ThresholdConfig thresholds;
  /// Empty means every channel.
  std::vector<std::string> channels;
  std::size_t max_content_length = 50000;
  bool fail_open = false;
  bool log_detections = true;
};

/// Remote LLM check for messages leaving search sessions. Has no fail-open switch.
struct ContentGuardConfig {
  bool enabled = true;
  std::string api_url = "https://openrouter.ai/api/v1/chat/completions";
  std::string model = "anthropic/claude-haiku-4-5";
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 15000;
  std::size_t max_content_length = 50000;
  std::string session_prefix = "agent:search:";
  ThresholdConfig thresholds;
  bool log_detections = true;
};

struct Config {
  ObservabilityConfig observability;
  ClassifierConfig classifier;
  NetworkGuardConfig network_guard;
  CommandGuardConfig command_guard;
  FileGuardConfig file_guard;
  WebGuardConfig web_guard;
  AgentGuardConfig agent_guard;
  ChannelGuardConfig channel_guard;
  ContentGuardConfig content_guard;
};

} // namespace clawguard::config
