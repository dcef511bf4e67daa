#pragma once

#include "clawguard/common/result.hpp"

#include <string>
#include <vector>

namespace clawguard::net {

struct Url {
  std::string scheme;
  /// Percent-decoded and normalized (see normalize_hostname).
  std::string host;
  std::string port;
  std::string path;
  std::string text;
};

/// Parses an absolute URL with libcurl's URL API. Schemes curl does not speak are still
/// accepted so that callers can reject them by name.
[[nodiscard]] common::Result<Url> parse_url(const std::string &text);

/// Resolves a redirect `Location` value against the URL that produced it.
[[nodiscard]] common::Result<std::string> resolve_url(const std::string &base,
                                                      const std::string &reference);

/// Every http(s) URL that appears in free text such as a shell command.
[[nodiscard]] std::vector<std::string> extract_urls(const std::string &text);

} // namespace clawguard::net
