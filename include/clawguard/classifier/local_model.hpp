#pragma once

#include "clawguard/classifier/classifier.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/net/http_client.hpp"

#include <memory>

namespace clawguard::classifier {

/// Sequence-classification model behind an inference server. The request is
/// `{"inputs": "...", "truncate": true}`; the answer is a list of `{label, score}` pairs,
/// possibly nested one level, and the highest-scoring pair is used.
class LocalModelClassifier final : public IContentClassifier {
public:
  LocalModelClassifier(std::shared_ptr<net::HttpClient> http, config::ClassifierConfig config);

  [[nodiscard]] common::Result<ClassifierOutput>
  classify(const std::string &text, std::chrono::milliseconds timeout) override;
  /// Sends a short probe so an unreachable server fails here rather than on real content.
  [[nodiscard]] common::Status warmup() override;
  [[nodiscard]] std::string name() const override;

private:
  std::shared_ptr<net::HttpClient> http_;
  config::ClassifierConfig config_;
};

[[nodiscard]] common::Result<ClassifierOutput>
parse_local_model_response(const std::string &body, const std::string &injection_label);

} // namespace clawguard::classifier
