#pragma once

#include "clawguard/classifier/classifier.hpp"
#include "clawguard/config/schema.hpp"
#include "clawguard/net/http_client.hpp"

#include <memory>

namespace clawguard::classifier {

/// Chat-completions model asked to answer with a single word, SAFE or INJECTION. The verdict
/// is binary, so the score is 0.0 or 1.0.
class RemoteLlmClassifier final : public IContentClassifier {
public:
  RemoteLlmClassifier(std::shared_ptr<net::HttpClient> http, config::ContentGuardConfig config);

  [[nodiscard]] common::Result<ClassifierOutput>
  classify(const std::string &text, std::chrono::milliseconds timeout) override;
  /// Fails without an API key.
  [[nodiscard]] common::Status warmup() override;
  [[nodiscard]] std::string name() const override;

private:
  [[nodiscard]] std::string build_body(const std::string &text) const;

  std::shared_ptr<net::HttpClient> http_;
  config::ContentGuardConfig config_;
};

/// `choices[0].message.content` of a chat-completions response.
[[nodiscard]] common::Result<std::string> extract_completion_text(const std::string &body);
/// First word of the completion, uppercased, mapped to a label.
[[nodiscard]] ClassifierOutput interpret_completion(const std::string &completion);

} // namespace clawguard::classifier
