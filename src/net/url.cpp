#include "clawguard/net/url.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/net/ip_range.hpp"

#include <curl/curl.h>

#include <regex>

namespace clawguard::net {

namespace {

class UrlHandle {
public:
  UrlHandle() : handle_(curl_url()) {}
  ~UrlHandle() {
    if (handle_ != nullptr) {
      curl_url_cleanup(handle_);
    }
  }

  UrlHandle(const UrlHandle &) = delete;
  UrlHandle &operator=(const UrlHandle &) = delete;

  [[nodiscard]] CURLU *get() const { return handle_; }

  [[nodiscard]] CURLUcode set_url(const std::string &text) {
    return curl_url_set(handle_, CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME);
  }

  [[nodiscard]] std::string part(const CURLUPart which, const unsigned int flags = 0) const {
    char *value = nullptr;
    if (curl_url_get(handle_, which, &value, flags) != CURLUE_OK || value == nullptr) {
      return "";
    }
    std::string out(value);
    curl_free(value);
    return out;
  }

private:
  CURLU *handle_;
};

std::string url_error(const CURLUcode code) {
  return std::string("invalid URL: ") + curl_url_strerror(code);
}

} // namespace

common::Result<Url> parse_url(const std::string &text) {
  UrlHandle handle;
  if (handle.get() == nullptr) {
    return common::Result<Url>::failure("curl_url failed");
  }
  if (const auto code = handle.set_url(common::trim(text)); code != CURLUE_OK) {
    return common::Result<Url>::failure(url_error(code), common::ErrorKind::Resolution);
  }

  Url url;
  url.scheme = common::to_lower(handle.part(CURLUPART_SCHEME));
  url.host = normalize_hostname(handle.part(CURLUPART_HOST, CURLU_URLDECODE));
  url.port = handle.part(CURLUPART_PORT);
  url.path = handle.part(CURLUPART_PATH);
  url.text = handle.part(CURLUPART_URL);
  if (url.host.empty()) {
    return common::Result<Url>::failure("URL has no host: " + text, common::ErrorKind::Resolution);
  }
  return common::Result<Url>::success(std::move(url));
}

common::Result<std::string> resolve_url(const std::string &base, const std::string &reference) {
  UrlHandle handle;
  if (handle.get() == nullptr) {
    return common::Result<std::string>::failure("curl_url failed");
  }
  if (const auto code = handle.set_url(base); code != CURLUE_OK) {
    return common::Result<std::string>::failure(url_error(code), common::ErrorKind::Resolution);
  }
  // A relative reference is resolved against the URL already held by the handle.
  if (const auto code = handle.set_url(common::trim(reference)); code != CURLUE_OK) {
    return common::Result<std::string>::failure(url_error(code), common::ErrorKind::Resolution);
  }
  return common::Result<std::string>::success(handle.part(CURLUPART_URL));
}

std::vector<std::string> extract_urls(const std::string &text) {
  static const std::regex url_re(R"(https?://[^\s"'`,;)}\]>]+)", std::regex::icase);
  std::vector<std::string> urls;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), url_re);
       it != std::sregex_iterator(); ++it) {
    urls.push_back(it->str());
  }
  return urls;
}

} // namespace clawguard::net
