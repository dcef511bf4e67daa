#include "clawguard/net/http_client.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/net/ip_range.hpp"

#include <curl/curl.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <optional>

namespace clawguard::net {

namespace {

struct BodySink {
  std::string *body = nullptr;
  std::size_t max_bytes = 0;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *sink = static_cast<BodySink *>(userdata);
  if (sink->max_bytes == 0 || sink->body->size() < sink->max_bytes) {
    const std::size_t room =
        sink->max_bytes == 0 ? total : std::min(total, sink->max_bytes - sink->body->size());
    sink->body->append(ptr, room);
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

struct SocketPolicy {
  bool public_only = false;
  bool blocked = false;
  std::string blocked_address;
};

std::string peer_address(const sockaddr *addr) {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (addr->sa_family == AF_INET) {
    const auto *v4 = reinterpret_cast<const sockaddr_in *>(addr);
    if (inet_ntop(AF_INET, &v4->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      return buffer;
    }
  } else if (addr->sa_family == AF_INET6) {
    const auto *v6 = reinterpret_cast<const sockaddr_in6 *>(addr);
    if (inet_ntop(AF_INET6, &v6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
      return buffer;
    }
  }
  return "";
}

// Runs after curl's own DNS lookup, on the exact address it is about to dial, so a name that
// re-resolves to a private address between validation and connect is still refused.
curl_socket_t open_socket_callback(void *clientp, curlsocktype purpose,
                                   struct curl_sockaddr *address) {
  auto *policy = static_cast<SocketPolicy *>(clientp);
  if (policy->public_only && purpose == CURLSOCKTYPE_IPCXN) {
    const std::string peer = peer_address(&address->addr);
    if (peer.empty() || is_private_or_reserved(peer)) {
      policy->blocked = true;
      policy->blocked_address = peer;
      return CURL_SOCKET_BAD;
    }
  }
  return socket(address->family, address->socktype, address->protocol);
}

HttpResponse execute_request(const std::string &url, const HttpHeaders &headers,
                             const std::optional<std::string> &body, const std::uint64_t timeout_ms,
                             const bool public_only, const std::size_t max_body_bytes) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  BodySink sink{.body = &response.body, .max_bytes = max_body_bytes};
  SocketPolicy policy{.public_only = public_only};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "ClawGuard/0.1");
#if LIBCURL_VERSION_NUM >= 0x075500
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
#else
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

  if (public_only) {
    // A proxy from the environment would be the dialled peer instead of the target.
    curl_easy_setopt(curl, CURLOPT_PROXY, "");
    curl_easy_setopt(curl, CURLOPT_OPENSOCKETFUNCTION, open_socket_callback);
    curl_easy_setopt(curl, CURLOPT_OPENSOCKETDATA, &policy);
  }

  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    response.blocked_address = policy.blocked;
    response.network_error_message =
        policy.blocked ? "connection to non-public address refused: " + policy.blocked_address
                       : std::string(curl_easy_strerror(code));
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpHeaders with_type = headers;
  with_type.emplace("Content-Type", "application/json");
  return execute_request(url, with_type, body, timeout_ms, false, 0);
}

HttpResponse CurlHttpClient::get(const std::string &url, const HttpHeaders &headers,
                                 const GetOptions &options) {
  return execute_request(url, headers, std::nullopt, options.timeout_ms, options.public_only,
                         options.max_body_bytes);
}

} // namespace clawguard::net
