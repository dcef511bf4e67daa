#include "clawguard/classifier/local_model.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/common/json_util.hpp"

#include <cstdlib>

namespace clawguard::classifier {

namespace {

using OutputResult = common::Result<ClassifierOutput>;

OutputResult response_failure(const net::HttpResponse &response) {
  if (response.timeout) {
    return OutputResult::failure("classifier request timed out", common::ErrorKind::Timeout);
  }
  if (response.network_error) {
    return OutputResult::failure("classifier unreachable: " + response.network_error_message,
                                 common::ErrorKind::Classifier);
  }
  return OutputResult::failure("classifier returned HTTP " + std::to_string(response.status),
                               common::ErrorKind::Classifier);
}

} // namespace

LocalModelClassifier::LocalModelClassifier(std::shared_ptr<net::HttpClient> http,
                                           config::ClassifierConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

common::Result<ClassifierOutput> LocalModelClassifier::classify(const std::string &text,
                                                               const std::chrono::milliseconds timeout) {
  const std::string body =
      "{\"inputs\":\"" + common::json_escape(text) + "\",\"truncate\":true}";
  const auto response = http_->post_json(config_.endpoint, {}, body,
                                         static_cast<std::uint64_t>(timeout.count()));
  if (response.timeout || response.network_error || !response.is_success()) {
    return response_failure(response);
  }
  return parse_local_model_response(response.body, config_.injection_label);
}

common::Status LocalModelClassifier::warmup() {
  const auto probe = classify("warmup", std::chrono::milliseconds(config_.timeout_ms));
  if (!probe.ok()) {
    return common::Status::error("classifier " + config_.model + " at " + config_.endpoint +
                                     " not ready: " + probe.error(),
                                 probe.kind());
  }
  return common::Status::success();
}

std::string LocalModelClassifier::name() const { return config_.model; }

common::Result<ClassifierOutput> parse_local_model_response(const std::string &body,
                                                            const std::string &injection_label) {
  std::string list = common::trim(body);
  if (list.empty() || list.front() != '[') {
    return OutputResult::failure("classifier response is not a JSON array",
                                 common::ErrorKind::Classifier);
  }

  auto entries = common::json_split_array(list);
  if (!entries.empty()) {
    if (const std::string first = common::trim(entries.front()); !first.empty() && first.front() == '[') {
      entries = common::json_split_array(first);
    }
  }

  bool found = false;
  ClassifierOutput best;
  for (const auto &entry : entries) {
    const std::string trimmed = common::trim(entry);
    if (trimmed.empty() || trimmed.front() != '{') {
      continue;
    }
    const std::string label = common::json_get_string(trimmed, "label");
    const std::string score_text = common::json_get_number(trimmed, "score");
    if (label.empty() || score_text.empty()) {
      continue;
    }
    char *end = nullptr;
    const double score = std::strtod(score_text.c_str(), &end);
    if (end == score_text.c_str()) {
      continue;
    }
    if (!found || score > best.score) {
      best = ClassifierOutput{
          .label = parse_label(label, injection_label), .score = score, .raw_label = label};
      found = true;
    }
  }

  if (!found) {
    return OutputResult::failure("classifier response has no label/score pair",
                                 common::ErrorKind::Classifier);
  }
  return OutputResult::success(std::move(best));
}

} // namespace clawguard::classifier
