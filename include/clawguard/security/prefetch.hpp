#pragma once

#include "clawguard/net/http_client.hpp"
#include "clawguard/security/url_safety.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace clawguard::security {

enum class PrefetchOutcome {
  Fetched,
  /// Nothing came back to inspect: HTTP error status, connection failure, redirect without a
  /// Location.
  Unreachable,
  /// A hop failed validation, the redirect limit was exceeded, or the fetch timed out.
  Unsafe,
};

struct PrefetchResult {
  PrefetchOutcome outcome = PrefetchOutcome::Unreachable;
  std::string final_url;
  std::string body;
  std::string content_type;
  std::string reason;
  std::size_t redirects = 0;
};

struct PrefetchOptions {
  /// Budget for the whole chain, DNS lookups included.
  std::chrono::milliseconds timeout{10000};
  std::size_t max_redirects = 5;
  std::size_t max_body_bytes = 2 * 1024 * 1024;
};

class ContentPrefetcher {
public:
  ContentPrefetcher(std::shared_ptr<net::HttpClient> http,
                    std::shared_ptr<const UrlSafetyValidator> validator);

  /// Fetches `url` without letting the HTTP layer follow redirects; every hop is checked with
  /// the validator (scheme, hostname, resolved addresses) before it is requested.
  [[nodiscard]] PrefetchResult fetch(const std::string &url, const PrefetchOptions &options) const;

private:
  std::shared_ptr<net::HttpClient> http_;
  std::shared_ptr<const UrlSafetyValidator> validator_;
};

/// Visible text of an HTML document: scripts, styles and tags removed, block elements turned
/// into line breaks, common entities decoded. Non-HTML input is returned unchanged.
[[nodiscard]] std::string extract_readable_text(const std::string &body);

/// Bot-challenge interstitials carry no page content worth classifying.
[[nodiscard]] bool looks_like_challenge_page(const std::string &content);

} // namespace clawguard::security
