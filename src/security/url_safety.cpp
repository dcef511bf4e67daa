#include "clawguard/security/url_safety.hpp"

#include "clawguard/common/fs.hpp"
#include "clawguard/net/ip_range.hpp"
#include "clawguard/net/url.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <future>
#include <system_error>
#include <thread>

namespace clawguard::security {

namespace {

using AddressList = common::Result<std::vector<std::string>>;

AddressList lookup_addresses(const std::string &hostname) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *results = nullptr;
  const int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &results);
  if (rc != 0) {
    return AddressList::failure("DNS lookup failed for " + hostname + ": " + gai_strerror(rc),
                                common::ErrorKind::Resolution);
  }

  std::vector<std::string> addresses;
  for (const addrinfo *entry = results; entry != nullptr; entry = entry->ai_next) {
    char buffer[INET6_ADDRSTRLEN] = {0};
    const void *raw = nullptr;
    if (entry->ai_family == AF_INET) {
      raw = &reinterpret_cast<const sockaddr_in *>(entry->ai_addr)->sin_addr;
    } else if (entry->ai_family == AF_INET6) {
      raw = &reinterpret_cast<const sockaddr_in6 *>(entry->ai_addr)->sin6_addr;
    } else {
      continue;
    }
    if (inet_ntop(entry->ai_family, raw, buffer, sizeof(buffer)) == nullptr) {
      continue;
    }
    std::string address(buffer);
    if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
      addresses.push_back(std::move(address));
    }
  }
  freeaddrinfo(results);
  return AddressList::success(std::move(addresses));
}

UrlCheck reject(UrlRejection rejection, std::string hostname, std::string reason) {
  return UrlCheck{
      .rejection = rejection, .hostname = std::move(hostname), .reason = std::move(reason)};
}

} // namespace

SystemDnsResolver::SystemDnsResolver(const std::size_t max_in_flight)
    : max_in_flight_(max_in_flight), in_flight_(std::make_shared<std::atomic<std::size_t>>(0)) {}

std::size_t SystemDnsResolver::in_flight() const { return in_flight_->load(); }

common::Result<std::vector<std::string>>
SystemDnsResolver::resolve(const std::string &hostname, const std::chrono::milliseconds timeout) {
  std::size_t current = in_flight_->load();
  do {
    if (current >= max_in_flight_) {
      return AddressList::failure("DNS lookup for " + hostname + " refused: " +
                                      std::to_string(current) + " lookups already in flight",
                                  common::ErrorKind::Resolution);
    }
  } while (!in_flight_->compare_exchange_weak(current, current + 1));

  auto promise = std::make_shared<std::promise<AddressList>>();
  auto answer = promise->get_future();

  try {
    std::thread([promise, hostname, counter = in_flight_] {
      promise->set_value(lookup_addresses(hostname));
      counter->fetch_sub(1);
    }).detach();
  } catch (const std::system_error &ex) {
    in_flight_->fetch_sub(1);
    return AddressList::failure("DNS lookup for " + hostname + " could not start: " + ex.what(),
                                common::ErrorKind::Resolution);
  }

  if (answer.wait_for(timeout) != std::future_status::ready) {
    return AddressList::failure("DNS lookup for " + hostname + " timed out after " +
                                    std::to_string(timeout.count()) + "ms",
                                common::ErrorKind::Timeout);
  }
  return answer.get();
}

bool is_blocked_hostname(const std::string &hostname) {
  const std::string normalized = net::normalize_hostname(hostname);
  return normalized == "localhost" || common::ends_with(normalized, ".localhost");
}

UrlSafetyValidator::UrlSafetyValidator(std::shared_ptr<DnsResolver> resolver)
    : resolver_(std::move(resolver)) {}

UrlCheck UrlSafetyValidator::check_url(const std::string &url) const {
  const auto parsed = net::parse_url(url);
  if (!parsed.ok()) {
    return reject(UrlRejection::Malformed, "", "invalid URL");
  }

  const auto &value = parsed.value();
  if (value.scheme != "http" && value.scheme != "https") {
    return reject(UrlRejection::Scheme, value.host, "unsupported URL scheme: " + value.scheme);
  }

  if (is_blocked_hostname(value.host)) {
    return reject(UrlRejection::BlockedHostname, value.host, "hostname blocked: " + value.host);
  }

  if (net::is_ip_literal(value.host) && net::is_private_or_reserved(value.host)) {
    return reject(UrlRejection::PrivateAddress, value.host,
                  "private or reserved IP address blocked: " + value.host);
  }

  return UrlCheck{.rejection = UrlRejection::None, .hostname = value.host, .reason = ""};
}

bool UrlSafetyValidator::is_allowed_url(const std::string &url) const {
  return check_url(url).allowed();
}

UrlCheck UrlSafetyValidator::check_resolution(const std::string &hostname,
                                              const std::chrono::milliseconds timeout) const {
  const std::string host = net::normalize_hostname(hostname);
  if (net::is_ip_literal(host)) {
    if (net::is_private_or_reserved(host)) {
      return reject(UrlRejection::PrivateAddress, host,
                    "private or reserved IP address blocked: " + host);
    }
    return UrlCheck{.rejection = UrlRejection::None, .hostname = host, .reason = ""};
  }

  if (resolver_ == nullptr) {
    return reject(UrlRejection::Resolution, host, "no DNS resolver available for " + host);
  }

  const auto resolved = resolver_->resolve(host, timeout);
  if (!resolved.ok()) {
    const bool timed_out = resolved.kind() == common::ErrorKind::Timeout;
    return reject(UrlRejection::Resolution, host,
                  timed_out ? "DNS resolution timed out for " + host
                            : "DNS resolution failed for " + host);
  }
  if (resolved.value().empty()) {
    return reject(UrlRejection::Resolution, host, "DNS returned no addresses for " + host);
  }
  for (const auto &address : resolved.value()) {
    if (net::is_private_or_reserved(address)) {
      return reject(UrlRejection::PrivateAddress, host,
                    host + " resolves to a private or reserved address (" + address + ")");
    }
  }
  return UrlCheck{.rejection = UrlRejection::None, .hostname = host, .reason = ""};
}

bool UrlSafetyValidator::resolves_to_public_addresses(
    const std::string &hostname, const std::chrono::milliseconds timeout) const {
  return check_resolution(hostname, timeout).allowed();
}

UrlCheck UrlSafetyValidator::check_public_destination(
    const std::string &url, const std::chrono::milliseconds timeout) const {
  auto check = check_url(url);
  if (!check.allowed()) {
    return check;
  }
  return check_resolution(check.hostname, timeout);
}

} // namespace clawguard::security
