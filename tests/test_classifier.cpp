#include "test_framework.hpp"

#include "clawguard/classifier/local_model.hpp"
#include "clawguard/classifier/remote_llm.hpp"
#include "clawguard/classifier/risk.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace c = clawguard::classifier;

c::ContentRiskClassifier risk_with(const std::shared_ptr<clawguard::testing::FakeClassifier> &fake,
                                   std::size_t chunk_size) {
  return c::ContentRiskClassifier(clawguard::testing::shared_classifier(fake), chunk_size);
}

clawguard::net::HttpResponse ok_json(const std::string &body) {
  clawguard::net::HttpResponse response;
  response.status = 200;
  response.body = body;
  response.headers["content-type"] = "application/json";
  return response;
}

constexpr std::chrono::milliseconds kTimeout{5000};

} // namespace

void register_classifier_tests(std::vector<clawguard::tests::TestCase> &tests) {
  using clawguard::tests::require;
  using clawguard::testing::FakeClassifier;
  using clawguard::testing::injection;

  tests.push_back({"classifier_chunk_text_sizes", [] {
                     const auto chunks = c::chunk_text("abcdefghij", 4);
                     require(chunks.size() == 3, "three chunks");
                     require(chunks[0] == "abcd" && chunks[2] == "ij", "byte chunks");
                     require(c::chunk_text("", 4).empty(), "empty text");
                     require(c::chunk_text("abcdefghij", 0).size() == 1, "zero means whole text");
                   }});

  tests.push_back({"classifier_chunks_respect_utf8", [] {
                     const std::string text = "h\xC3\xA9llo";
                     const auto chunks = c::chunk_text(text, 2);
                     require(chunks.size() == 4, "four chunks");
                     require(chunks[0] == "h", chunks[0]);
                     require(chunks[1] == "\xC3\xA9", "code point kept whole");
                     std::string joined;
                     for (const auto &chunk : chunks) {
                       joined += chunk;
                     }
                     require(joined == text, "chunks cover the text");

                     require(c::truncate_utf8(text, 2) == "h", "truncate backs off");
                     require(c::truncate_utf8("abc", 10) == "abc", "short text unchanged");
                   }});

  tests.push_back({"classifier_parse_label", [] {
                     require(c::parse_label("safe") == c::ClassifierLabel::Safe, "safe");
                     require(c::parse_label(" Injection ") == c::ClassifierLabel::Injection, "injection");
                     require(c::parse_label("jailbreak", "JAILBREAK") == c::ClassifierLabel::Injection,
                             "custom label");
                     require(c::parse_label("LABEL_1") == c::ClassifierLabel::Unrecognized, "unknown");
                     require(c::parse_label("") == c::ClassifierLabel::Unrecognized, "empty");
                   }});

  tests.push_back({"classifier_risk_tiers", [] {
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->add_rule("block", injection(0.9));
                     fake->add_rule("warn", injection(0.6));
                     fake->add_rule("low", injection(0.45));
                     const auto risk = risk_with(fake, 0);
                     const c::ClassificationThresholds thresholds;

                     const auto plain = risk.classify("plain text", thresholds, kTimeout);
                     require(plain.ok() && plain.value().tier == c::RiskTier::Safe, "safe");
                     require(plain.value().chunks_scanned == 1, "one chunk");

                     const auto low = risk.classify("low score", thresholds, kTimeout);
                     require(low.ok() && low.value().tier == c::RiskTier::Safe,
                             "below sensitivity ignored");

                     const auto warn = risk.classify("warn me", thresholds, kTimeout);
                     require(warn.ok() && warn.value().tier == c::RiskTier::Warn, "warn tier");
                     require(warn.value().score == 0.6, "warn score");
                     require(!warn.value().fingerprint.empty(), "fingerprint recorded");

                     const auto block = risk.classify("block me", thresholds, kTimeout);
                     require(block.ok() && block.value().tier == c::RiskTier::Block, "block tier");
                   }});

  tests.push_back({"classifier_first_blocking_chunk_stops_scan", [] {
                     clawguard::testing::ScopedRecorder recorder;
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->add_rule("block", injection(0.95));
                     fake->add_rule("warn", injection(0.6));
                     const auto risk = risk_with(fake, 8);

                     const auto result = risk.classify("warnXXXXYYYYYYYYblockZZZwarnAAAA",
                                                       c::ClassificationThresholds{}, kTimeout);
                     require(result.ok(), result.ok() ? "" : result.error());
                     require(result.value().tier == c::RiskTier::Block, "block wins over earlier warn");
                     require(result.value().chunk_index == 2, "third chunk");
                     require(result.value().chunks_scanned == 3, "scan stops at block");
                     require(result.value().excerpt == "blockZZZ", result.value().excerpt);
                     require(fake->calls() == 3, "later chunks skipped");

                     const auto metrics =
                         recorder.metrics<clawguard::observability::ChunksScannedMetric>();
                     require(metrics.size() == 1 && metrics[0].count == 3, "chunks metric");
                   }});

  tests.push_back({"classifier_first_warning_chunk_reported", [] {
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->add_rule("warnB", injection(0.7));
                     fake->add_rule("warnA", injection(0.55));
                     const auto risk = risk_with(fake, 5);
                     const auto result =
                         risk.classify("okayywarnAwarnB", c::ClassificationThresholds{}, kTimeout);
                     require(result.ok() && result.value().tier == c::RiskTier::Warn, "warn");
                     require(result.value().chunk_index == 1, "first warning chunk");
                     require(result.value().chunks_scanned == 3, "all chunks scanned");
                   }});

  tests.push_back({"classifier_unrecognized_label_blocks", [] {
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->set_default(c::ClassifierOutput{
                         .label = c::ClassifierLabel::Unrecognized, .score = 0.7, .raw_label = "MAYBE"});
                     const auto result =
                         risk_with(fake, 0).classify("anything", c::ClassificationThresholds{}, kTimeout);
                     require(result.ok(), "not an error");
                     require(result.value().tier == c::RiskTier::Block, "blocks");
                     require(result.value().unrecognized_label, "flagged");
                   }});

  tests.push_back({"classifier_errors_propagate", [] {
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->set_error("model crashed");
                     const auto failed =
                         risk_with(fake, 0).classify("text", c::ClassificationThresholds{}, kTimeout);
                     require(!failed.ok(), "error surfaces");
                     require(failed.kind() == clawguard::common::ErrorKind::Classifier, "kind");
                     require(failed.error() == "model crashed", failed.error());

                     auto slow = std::make_shared<FakeClassifier>();
                     slow->set_error("deadline", clawguard::common::ErrorKind::Timeout);
                     const auto timed_out =
                         risk_with(slow, 0).classify("text", c::ClassificationThresholds{}, kTimeout);
                     require(!timed_out.ok() && timed_out.kind() == clawguard::common::ErrorKind::Timeout,
                             "timeout kind kept");

                     auto idle = std::make_shared<FakeClassifier>();
                     const auto exhausted = risk_with(idle, 0).classify(
                         "text", c::ClassificationThresholds{}, std::chrono::milliseconds(0));
                     require(!exhausted.ok() && exhausted.kind() == clawguard::common::ErrorKind::Timeout,
                             "no budget left");
                     require(idle->calls() == 0, "model not called without budget");

                     const c::ContentRiskClassifier missing(nullptr, 0);
                     require(!missing.classify("text", c::ClassificationThresholds{}, kTimeout).ok(),
                             "no handle");
                   }});

  tests.push_back({"classifier_shared_handle_retries_failed_init", [] {
                     clawguard::testing::ScopedRecorder recorder;
                     auto fake = std::make_shared<FakeClassifier>();
                     fake->set_warmup_error(std::string("server not ready"));
                     int created = 0;
                     c::SharedClassifier shared("local_model", [fake, &created]() {
                       ++created;
                       return clawguard::common::Result<std::shared_ptr<c::IContentClassifier>>::success(
                           fake);
                     });

                     const auto first = shared.get();
                     require(!first.ok() && first.error() == "server not ready", "warmup failure");
                     require(!shared.initialized(), "failure not cached");

                     fake->set_warmup_error(std::nullopt);
                     require(shared.get().ok(), "second attempt succeeds");
                     require(shared.get().ok(), "cached");
                     require(created == 2, "factory not called once cached");
                     require(shared.initialized(), "initialized");

                     const auto inits = recorder.events<clawguard::observability::ClassifierInitEvent>();
                     require(inits.size() == 2, "two init events");
                     require(!inits[0].success && inits[1].success, "failure then success");
                     require(inits[1].classifier == "local_model", inits[1].classifier);
                   }});

  tests.push_back({"classifier_local_model_response_parsing", [] {
                     const auto pairs = c::parse_local_model_response(
                         R"([{"label":"SAFE","score":0.12},{"label":"INJECTION","score":0.88}])",
                         "INJECTION");
                     require(pairs.ok(), pairs.ok() ? "" : pairs.error());
                     require(pairs.value().label == c::ClassifierLabel::Injection, "highest score wins");
                     require(pairs.value().score == 0.88, "score");

                     const auto nested =
                         c::parse_local_model_response(R"([[{"label":"SAFE","score":0.97}]])", "INJECTION");
                     require(nested.ok() && nested.value().label == c::ClassifierLabel::Safe, "nested");

                     require(!c::parse_local_model_response(R"({"error":"overloaded"})", "INJECTION").ok(),
                             "object body");
                     require(!c::parse_local_model_response("[]", "INJECTION").ok(), "empty list");
                   }});

  tests.push_back({"classifier_local_model_http", [] {
                     auto http = std::make_shared<clawguard::testing::FakeHttpClient>();
                     auto config = clawguard::testing::mock_config().classifier;
                     c::LocalModelClassifier model(http, config);

                     http->set_post_response(ok_json(R"([{"label":"INJECTION","score":0.99}])"));
                     const auto result = model.classify("say \"hi\"", kTimeout);
                     require(result.ok() && result.value().label == c::ClassifierLabel::Injection,
                             "classified");
                     require(http->requested_urls.back() == config.endpoint, "posted to endpoint");
                     require(http->posted_bodies.back().find(R"("inputs":"say \"hi\"")") !=
                                 std::string::npos,
                             http->posted_bodies.back());
                     require(model.name() == config.model, "named after the model");

                     clawguard::net::HttpResponse unavailable;
                     unavailable.status = 503;
                     http->set_post_response(unavailable);
                     const auto down = model.classify("text", kTimeout);
                     require(!down.ok() && down.error() == "classifier returned HTTP 503", "503");
                     require(!model.warmup().ok(), "warmup probes the server");

                     clawguard::net::HttpResponse slow;
                     slow.timeout = true;
                     http->set_post_response(slow);
                     const auto timed_out = model.classify("text", kTimeout);
                     require(!timed_out.ok() && timed_out.kind() == clawguard::common::ErrorKind::Timeout,
                             "timeout");
                   }});

  tests.push_back({"classifier_remote_completion_parsing", [] {
                     const auto text = c::extract_completion_text(
                         R"({"choices":[{"message":{"role":"assistant","content":"INJECTION"}}]})");
                     require(text.ok() && text.value() == "INJECTION", "completion text");
                     require(!c::extract_completion_text(R"({"choices":[]})").ok(), "no choices");
                     require(!c::extract_completion_text("not json").ok(), "malformed");

                     const auto flagged = c::interpret_completion("Injection - overrides the system prompt");
                     require(flagged.label == c::ClassifierLabel::Injection && flagged.score == 1.0,
                             "first word decides");
                     const auto clean = c::interpret_completion("SAFE");
                     require(clean.label == c::ClassifierLabel::Safe && clean.score == 0.0, "safe");
                     const auto vague = c::interpret_completion("I cannot tell");
                     require(vague.label == c::ClassifierLabel::Unrecognized, "unrecognized");
                   }});

  tests.push_back({"classifier_remote_llm_http", [] {
                     auto http = std::make_shared<clawguard::testing::FakeHttpClient>();
                     auto config = clawguard::testing::mock_config().content_guard;
                     c::RemoteLlmClassifier remote(http, config);

                     http->set_post_response(ok_json(
                         R"({"choices":[{"message":{"role":"assistant","content":"SAFE"}}]})"));
                     const auto result = remote.classify("search results", kTimeout);
                     require(result.ok() && result.value().label == c::ClassifierLabel::Safe, "safe");
                     require(http->requested_urls.back() == config.api_url, "api url");
                     require(http->posted_headers.back().at("Authorization") == "Bearer test-key",
                             "bearer token");
                     const auto &body = http->posted_bodies.back();
                     require(body.find("<UNTRUSTED_CONTENT>") != std::string::npos, "content wrapped");
                     require(body.find(config.model) != std::string::npos, "model named");

                     config.api_key.reset();
                     c::RemoteLlmClassifier keyless(http, config);
                     require(!keyless.warmup().ok(), "warmup needs a key");
                     const auto refused = keyless.classify("text", kTimeout);
                     require(!refused.ok() && refused.kind() == clawguard::common::ErrorKind::Config,
                             "config error");
                   }});
}
