#include "clawguard/guard/factory.hpp"

#include "clawguard/classifier/local_model.hpp"
#include "clawguard/classifier/remote_llm.hpp"
#include "clawguard/classifier/risk.hpp"
#include "clawguard/common/fs.hpp"
#include "clawguard/config/config.hpp"
#include "clawguard/security/command_patterns.hpp"
#include "clawguard/security/file_protection.hpp"
#include "clawguard/security/prefetch.hpp"

#include <chrono>
#include <unordered_map>

namespace clawguard::guard {

namespace {

using HandleResult = common::Result<std::shared_ptr<classifier::IContentClassifier>>;

std::vector<std::filesystem::path> self_protected_paths(const config::FileGuardConfig &config) {
  std::vector<std::filesystem::path> paths;
  if (!config.self_protect) {
    return paths;
  }
  if (const auto dir = config::config_dir(); dir.ok()) {
    paths.push_back(dir.value());
  }
  paths.emplace_back(common::expand_path(config.protection_file));
  return paths;
}

FileGuard make_file_guard(const config::FileGuardConfig &config) {
  const auto base = security::load_file_protection(config.protection_file);
  const auto protected_paths = self_protected_paths(config);

  std::unordered_map<std::string, security::FileProtector> agents;
  for (const auto &[agent, path] : config.agent_overrides) {
    if (const auto extra = security::load_file_protection_override(path)) {
      agents.emplace(agent, security::FileProtector(security::merge_file_protection(base, *extra),
                                                    protected_paths));
    }
  }
  return FileGuard(config, security::FileProtector(base, protected_paths), std::move(agents));
}

} // namespace

PipelineDependencies default_dependencies(const config::Config &config) {
  PipelineDependencies deps;
  deps.resolver = std::make_shared<security::SystemDnsResolver>();
  deps.http = std::make_shared<net::CurlHttpClient>();

  auto http = deps.http;
  const auto classifier_config = config.classifier;
  deps.local_classifier = std::make_shared<classifier::SharedClassifier>(
      "local_model", [http, classifier_config]() {
        return HandleResult::success(
            std::make_shared<classifier::LocalModelClassifier>(http, classifier_config));
      });

  const auto content_config = config.content_guard;
  deps.remote_classifier = std::make_shared<classifier::SharedClassifier>(
      "remote_llm", [http, content_config]() {
        return HandleResult::success(
            std::make_shared<classifier::RemoteLlmClassifier>(http, content_config));
      });
  return deps;
}

std::shared_ptr<const GuardPipeline> build_pipeline(const config::Config &config,
                                                    const PipelineDependencies &deps) {
  const auto validator = std::make_shared<const security::UrlSafetyValidator>(deps.resolver);
  const auto classifier_timeout = std::chrono::milliseconds(config.classifier.timeout_ms);
  const auto local_risk = std::make_shared<const classifier::ContentRiskClassifier>(
      deps.local_classifier, config.classifier.chunk_size);

  std::vector<Guard> guards;
  if (config.network_guard.enabled) {
    guards.emplace_back(std::in_place_type<NetworkGuard>, config.network_guard, validator);
  }
  if (config.command_guard.enabled) {
    guards.emplace_back(std::in_place_type<CommandGuard>, config.command_guard,
                        security::load_command_patterns(config.command_guard.patterns_file));
  }
  if (config.file_guard.enabled) {
    guards.emplace_back(make_file_guard(config.file_guard));
  }
  if (config.web_guard.enabled) {
    const auto prefetcher = std::make_shared<const security::ContentPrefetcher>(deps.http, validator);
    guards.emplace_back(std::in_place_type<WebContentGuard>, config.web_guard, validator, prefetcher,
                        local_risk, classifier_timeout);
  }
  if (config.agent_guard.enabled) {
    guards.emplace_back(std::in_place_type<AgentMessageGuard>, config.agent_guard, local_risk,
                        classifier_timeout);
  }
  if (config.channel_guard.enabled) {
    guards.emplace_back(std::in_place_type<ChannelGuard>, config.channel_guard, local_risk,
                        classifier_timeout);
  }
  if (config.content_guard.enabled) {
    // The remote model answers for the whole message at once.
    const auto remote_risk =
        std::make_shared<const classifier::ContentRiskClassifier>(deps.remote_classifier, 0);
    guards.emplace_back(std::in_place_type<ContentGuard>, config.content_guard, remote_risk);
  }
  return std::make_shared<const GuardPipeline>(std::move(guards));
}

GuardService::GuardService(PipelineDependencies deps) : deps_(std::move(deps)) {}

void GuardService::reload(const config::Config &config) {
  auto next = build_pipeline(config, deps_);
  std::lock_guard<std::mutex> lock(mutex_);
  pipeline_ = std::move(next);
}

GuardVerdict GuardService::evaluate(const ToolInvocation &invocation) const {
  const auto pipeline = snapshot();
  if (pipeline == nullptr) {
    return GuardVerdict::block("clawguard", "Guard pipeline is not configured, blocking as a "
                                            "precaution.");
  }
  return pipeline->evaluate(invocation);
}

std::shared_ptr<const GuardPipeline> GuardService::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pipeline_;
}

} // namespace clawguard::guard
