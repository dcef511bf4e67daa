#pragma once

#include "clawguard/common/result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace clawguard::security {

class DnsResolver {
public:
  virtual ~DnsResolver() = default;

  /// All addresses for `hostname`. Exceeding `timeout` fails with ErrorKind::Timeout.
  [[nodiscard]] virtual common::Result<std::vector<std::string>>
  resolve(const std::string &hostname, std::chrono::milliseconds timeout) = 0;
};

/// getaddrinfo on a detached worker; the caller stops waiting at the timeout and the late
/// answer is discarded. A timed-out worker keeps its slot until getaddrinfo returns, and at
/// most `max_in_flight` workers exist at once. Lookups beyond that fail immediately with
/// ErrorKind::Resolution.
class SystemDnsResolver final : public DnsResolver {
public:
  static constexpr std::size_t kDefaultMaxInFlight = 16;

  explicit SystemDnsResolver(std::size_t max_in_flight = kDefaultMaxInFlight);

  [[nodiscard]] common::Result<std::vector<std::string>>
  resolve(const std::string &hostname, std::chrono::milliseconds timeout) override;
  [[nodiscard]] std::size_t in_flight() const;

private:
  std::size_t max_in_flight_;
  // Shared with the workers so a late lookup can release its slot after the resolver is gone.
  std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

enum class UrlRejection {
  None,
  Malformed,
  Scheme,
  BlockedHostname,
  PrivateAddress,
  Resolution,
};

struct UrlCheck {
  UrlRejection rejection = UrlRejection::None;
  std::string hostname;
  std::string reason;

  [[nodiscard]] bool allowed() const { return rejection == UrlRejection::None; }
};

[[nodiscard]] bool is_blocked_hostname(const std::string &hostname);

class UrlSafetyValidator {
public:
  explicit UrlSafetyValidator(std::shared_ptr<DnsResolver> resolver);

  /// Static checks: scheme, hostname blocklist and IP literals. No network access.
  [[nodiscard]] UrlCheck check_url(const std::string &url) const;
  [[nodiscard]] bool is_allowed_url(const std::string &url) const;

  /// Resolves `hostname` and requires every returned address to be public. An IP literal is
  /// checked directly. Resolver errors, empty answers and timeouts are rejections.
  [[nodiscard]] UrlCheck check_resolution(const std::string &hostname,
                                          std::chrono::milliseconds timeout) const;
  [[nodiscard]] bool resolves_to_public_addresses(const std::string &hostname,
                                                  std::chrono::milliseconds timeout) const;

  /// check_url followed by check_resolution.
  [[nodiscard]] UrlCheck check_public_destination(const std::string &url,
                                                  std::chrono::milliseconds timeout) const;

private:
  std::shared_ptr<DnsResolver> resolver_;
};

} // namespace clawguard::security
