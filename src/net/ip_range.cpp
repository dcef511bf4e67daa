#include "clawguard/net/ip_range.hpp"

#include "clawguard/common/fs.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace clawguard::net {

namespace {

struct Ipv4Range {
  std::uint32_t first;
  std::uint32_t last;
};

// Inclusive bounds, host byte order.
constexpr Ipv4Range kNonPublicIpv4[] = {
    {0x00000000U, 0x00FFFFFFU}, // 0.0.0.0/8
    {0x0A000000U, 0x0AFFFFFFU}, // 10.0.0.0/8
    {0x64400000U, 0x647FFFFFU}, // 100.64.0.0/10
    {0x7F000000U, 0x7FFFFFFFU}, // 127.0.0.0/8
    {0xA9FE0000U, 0xA9FEFFFFU}, // 169.254.0.0/16
    {0xAC100000U, 0xAC1FFFFFU}, // 172.16.0.0/12
    {0xC0A80000U, 0xC0A8FFFFU}, // 192.168.0.0/16
    {0xC6120000U, 0xC613FFFFU}, // 198.18.0.0/15
    {0xE0000000U, 0xFFFFFFFFU}, // 224.0.0.0/4 through 255.255.255.255
};

struct Ipv6Range {
  Ipv6Segments first;
  Ipv6Segments last;
};

constexpr std::uint16_t kAll = 0xFFFF;

const Ipv6Range kNonPublicIpv6[] = {
    {{0, 0, 0, 0, 0, 0, 0, 0}, {0, 0, 0, 0, 0, 0, 0, 0}}, // ::
    {{0, 0, 0, 0, 0, 0, 0, 1}, {0, 0, 0, 0, 0, 0, 0, 1}}, // ::1
    {{0xFC00, 0, 0, 0, 0, 0, 0, 0},
     {0xFDFF, kAll, kAll, kAll, kAll, kAll, kAll, kAll}}, // fc00::/7
    {{0xFE80, 0, 0, 0, 0, 0, 0, 0},
     {0xFEBF, kAll, kAll, kAll, kAll, kAll, kAll, kAll}}, // fe80::/10
    {{0xFEC0, 0, 0, 0, 0, 0, 0, 0},
     {0xFEFF, kAll, kAll, kAll, kAll, kAll, kAll, kAll}}, // fec0::/10
    {{0xFF00, 0, 0, 0, 0, 0, 0, 0},
     {kAll, kAll, kAll, kAll, kAll, kAll, kAll, kAll}}, // ff00::/8
};

std::string strip_zone(const std::string &text) {
  const auto percent = text.find('%');
  return percent == std::string::npos ? text : text.substr(0, percent);
}

} // namespace

std::optional<std::uint32_t> parse_ipv4(const std::string &text) {
  in_addr addr{};
  if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
    return std::nullopt;
  }
  return ntohl(addr.s_addr);
}

std::optional<Ipv6Segments> parse_ipv6(const std::string &text) {
  const std::string bare = strip_zone(text);
  in6_addr addr{};
  if (inet_pton(AF_INET6, bare.c_str(), &addr) != 1) {
    return std::nullopt;
  }
  Ipv6Segments segments{};
  for (std::size_t i = 0; i < segments.size(); ++i) {
    segments[i] = static_cast<std::uint16_t>((addr.s6_addr[2 * i] << 8) | addr.s6_addr[2 * i + 1]);
  }
  return segments;
}

std::string normalize_hostname(const std::string &host) {
  std::string normalized = common::to_lower(common::trim(host));
  if (normalized.size() >= 2 && normalized.front() == '[' && normalized.back() == ']') {
    normalized = normalized.substr(1, normalized.size() - 2);
  }
  while (!normalized.empty() && normalized.back() == '.') {
    normalized.pop_back();
  }
  return normalized;
}

IpFamily ip_family(const std::string &host) {
  const std::string normalized = normalize_hostname(host);
  if (parse_ipv4(normalized).has_value()) {
    return IpFamily::V4;
  }
  if (normalized.find(':') != std::string::npos && parse_ipv6(normalized).has_value()) {
    return IpFamily::V6;
  }
  return IpFamily::None;
}

bool is_ip_literal(const std::string &host) { return ip_family(host) != IpFamily::None; }

std::optional<std::uint32_t> mapped_ipv4(const Ipv6Segments &segments) {
  for (std::size_t i = 0; i < 5; ++i) {
    if (segments[i] != 0) {
      return std::nullopt;
    }
  }
  if (segments[5] != 0xFFFF) {
    return std::nullopt;
  }
  return (static_cast<std::uint32_t>(segments[6]) << 16) | segments[7];
}

std::string format_ipv4(const std::uint32_t address) {
  return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
         "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

bool is_private_or_reserved_ipv4(const std::uint32_t address) {
  for (const auto &range : kNonPublicIpv4) {
    if (address >= range.first && address <= range.last) {
      return true;
    }
  }
  return false;
}

bool is_private_or_reserved_ipv6(const Ipv6Segments &segments) {
  if (const auto v4 = mapped_ipv4(segments); v4.has_value()) {
    return is_private_or_reserved_ipv4(*v4);
  }
  for (const auto &range : kNonPublicIpv6) {
    if (segments >= range.first && segments <= range.last) {
      return true;
    }
  }
  return false;
}

bool is_private_or_reserved(const std::string &address) {
  const std::string normalized = normalize_hostname(address);
  if (const auto v4 = parse_ipv4(normalized); v4.has_value()) {
    return is_private_or_reserved_ipv4(*v4);
  }
  if (const auto v6 = parse_ipv6(normalized); v6.has_value()) {
    return is_private_or_reserved_ipv6(*v6);
  }
  return true;
}

} // namespace clawguard::net
