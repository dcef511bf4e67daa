#pragma once

#include "clawguard/classifier/shared.hpp"
#include "clawguard/common/result.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/guard/pipeline.hpp"
#include "clawguard/net/http_client.hpp"
#include "clawguard/security/url_safety.hpp"

#include <memory>
#include <mutex>

namespace clawguard::guard {

/// Collaborators shared by every pipeline snapshot. Tests substitute fakes here.
struct PipelineDependencies {
  std::shared_ptr<security::DnsResolver> resolver;
  std::shared_ptr<net::HttpClient> http;
  std::shared_ptr<classifier::SharedClassifier> local_classifier;
  std::shared_ptr<classifier::SharedClassifier> remote_classifier;
};

/// System resolver, libcurl client, and lazily created local-model and remote-LLM classifiers.
[[nodiscard]] PipelineDependencies default_dependencies(const config::Config &config);

/// One guard per enabled section of `config`. Pattern and protection files are read here;
/// unusable files fall back to built-in rules.
[[nodiscard]] std::shared_ptr<const GuardPipeline> build_pipeline(const config::Config &config,
                                                                  const PipelineDependencies &deps);

/// Holds the live pipeline. `reload` builds a complete new snapshot before swapping it in, so
/// an evaluation never sees a half-applied configuration.
class GuardService {
public:
  explicit GuardService(PipelineDependencies deps);

  void reload(const config::Config &config);
  [[nodiscard]] GuardVerdict evaluate(const ToolInvocation &invocation) const;
  [[nodiscard]] std::shared_ptr<const GuardPipeline> snapshot() const;

private:
  PipelineDependencies deps_;
  mutable std::mutex mutex_;
  std::shared_ptr<const GuardPipeline> pipeline_;
};

} // namespace clawguard::guard
