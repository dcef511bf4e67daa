#include "clawguard/security/prefetch.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/net/url.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace clawguard::security {

namespace {

using Clock = std::chrono::steady_clock;

PrefetchResult finish(const PrefetchOutcome outcome, std::string url, std::string reason,
                      const std::size_t redirects) {
  PrefetchResult result;
  result.outcome = outcome;
  result.final_url = std::move(url);
  result.reason = std::move(reason);
  result.redirects = redirects;
  return result;
}

std::chrono::milliseconds remaining(const Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool looks_like_html(const std::string &body) {
  static const std::regex tag_re("<[a-z!][^>]*>", std::regex::icase);
  const std::string head = body.substr(0, 4096);
  return std::regex_search(head, tag_re);
}

std::string lower_ascii(const std::string &value) { return common::to_lower(value); }

// Case-insensitive find of an ASCII needle.
std::size_t find_ci(const std::string &haystack, const std::string &needle, std::size_t from) {
  const auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from), haystack.end(),
                              needle.begin(), needle.end(), [](const char a, const char b) {
                                return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b));
                              });
  return it == haystack.end() ? std::string::npos
                              : static_cast<std::size_t>(it - haystack.begin());
}

bool is_block_tag(const std::string &name) {
  static const std::array<const char *, 17> block_tags = {
      "p",  "div", "br", "li", "ul", "ol", "tr", "table", "section",
      "h1", "h2",  "h3", "h4", "h5", "h6", "article", "blockquote"};
  return std::find(block_tags.begin(), block_tags.end(), name) != block_tags.end();
}

std::string decode_entities(const std::string &text) {
  static const std::array<std::pair<const char *, const char *>, 7> entities = {{
      {"&amp;", "&"},
      {"&lt;", "<"},
      {"&gt;", ">"},
      {"&quot;", "\""},
      {"&#39;", "'"},
      {"&apos;", "'"},
      {"&nbsp;", " "},
  }};
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '&') {
      bool replaced = false;
      for (const auto &[entity, value] : entities) {
        const std::string needle(entity);
        if (text.compare(i, needle.size(), needle) == 0) {
          out += value;
          i += needle.size();
          replaced = true;
          break;
        }
      }
      if (replaced) {
        continue;
      }
    }
    out += text[i++];
  }
  return out;
}

std::string collapse_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  bool pending_newline = false;
  for (const char ch : text) {
    if (ch == '\n') {
      pending_newline = true;
      pending_space = false;
    } else if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!pending_newline) {
        pending_space = true;
      }
    } else {
      if (pending_newline && !out.empty()) {
        out += '\n';
      } else if (pending_space && !out.empty()) {
        out += ' ';
      }
      pending_newline = false;
      pending_space = false;
      out += ch;
    }
  }
  return out;
}

} // namespace

ContentPrefetcher::ContentPrefetcher(std::shared_ptr<net::HttpClient> http,
                                     std::shared_ptr<const UrlSafetyValidator> validator)
    : http_(std::move(http)), validator_(std::move(validator)) {}

PrefetchResult ContentPrefetcher::fetch(const std::string &url,
                                        const PrefetchOptions &options) const {
  const auto deadline = Clock::now() + options.timeout;
  std::string current = url;
  std::unordered_set<std::string> visited;

  for (std::size_t hop = 0; hop <= options.max_redirects; ++hop) {
    if (!visited.insert(current).second) {
      return finish(PrefetchOutcome::Unsafe, current, "redirect loop detected", hop);
    }

    const auto budget = remaining(deadline);
    if (budget.count() == 0) {
      return finish(PrefetchOutcome::Unsafe, current, "pre-fetch timed out", hop);
    }

    const auto check = validator_->check_public_destination(current, budget);
    if (!check.allowed()) {
      return finish(PrefetchOutcome::Unsafe, current, check.reason, hop);
    }

    const auto fetch_budget = remaining(deadline);
    if (fetch_budget.count() == 0) {
      return finish(PrefetchOutcome::Unsafe, current, "pre-fetch timed out", hop);
    }

    net::GetOptions get_options;
    get_options.timeout_ms = static_cast<std::uint64_t>(fetch_budget.count());
    get_options.public_only = true;
    get_options.max_body_bytes = options.max_body_bytes;
    const auto response = http_->get(current, {{"Accept", "text/html,text/plain,*/*"}}, get_options);

    if (response.timeout) {
      return finish(PrefetchOutcome::Unsafe, current, "pre-fetch timed out", hop);
    }
    if (response.blocked_address) {
      return finish(PrefetchOutcome::Unsafe, current, response.network_error_message, hop);
    }
    if (response.network_error) {
      return finish(PrefetchOutcome::Unreachable, current, response.network_error_message, hop);
    }

    if (response.is_redirect()) {
      const auto location = response.headers.find("location");
      if (location == response.headers.end() || common::trim(location->second).empty()) {
        return finish(PrefetchOutcome::Unreachable, current, "redirect without Location", hop);
      }
      const auto next = net::resolve_url(current, location->second);
      if (!next.ok()) {
        return finish(PrefetchOutcome::Unsafe, current, "invalid redirect target", hop);
      }
      current = next.value();
      continue;
    }

    if (!response.is_success()) {
      return finish(PrefetchOutcome::Unreachable, current,
                    "HTTP status " + std::to_string(response.status), hop);
    }

    auto result = finish(PrefetchOutcome::Fetched, current, "", hop);
    result.body = response.body;
    if (const auto type = response.headers.find("content-type"); type != response.headers.end()) {
      result.content_type = type->second;
    }
    return result;
  }

  return finish(PrefetchOutcome::Unsafe, current,
                "too many redirects (limit " + std::to_string(options.max_redirects) + ")",
                options.max_redirects + 1);
}

std::string extract_readable_text(const std::string &body) {
  if (!looks_like_html(body)) {
    return body;
  }

  std::string text;
  text.reserve(body.size() / 2);
  std::size_t i = 0;
  while (i < body.size()) {
    if (body[i] != '<') {
      text += body[i++];
      continue;
    }

    if (body.compare(i, 4, "<!--") == 0) {
      const auto end = body.find("-->", i + 4);
      i = end == std::string::npos ? body.size() : end + 3;
      continue;
    }

    const auto close = body.find('>', i);
    if (close == std::string::npos) {
      break;
    }
    std::string tag = body.substr(i + 1, close - i - 1);
    i = close + 1;

    bool closing = false;
    if (!tag.empty() && tag.front() == '/') {
      closing = true;
      tag.erase(0, 1);
    }
    std::size_t name_end = 0;
    while (name_end < tag.size() && std::isalnum(static_cast<unsigned char>(tag[name_end])) != 0) {
      ++name_end;
    }
    const std::string name = lower_ascii(tag.substr(0, name_end));

    if (!closing && (name == "script" || name == "style" || name == "noscript")) {
      const auto end = find_ci(body, "</" + name, i);
      if (end == std::string::npos) {
        break;
      }
      const auto end_close = body.find('>', end);
      i = end_close == std::string::npos ? body.size() : end_close + 1;
      text += ' ';
      continue;
    }

    text += is_block_tag(name) ? '\n' : ' ';
  }

  return common::trim(collapse_whitespace(decode_entities(text)));
}

bool looks_like_challenge_page(const std::string &content) {
  static const std::array<const char *, 4> markers = {"cf-mitigated", "__cf_chl", "Just a moment",
                                                      "challenge-platform"};
  return std::any_of(markers.begin(), markers.end(), [&](const char *marker) {
    return content.find(marker) != std::string::npos;
  });
}

} // namespace clawguard::security
