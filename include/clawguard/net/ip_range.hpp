#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace clawguard::net {

enum class IpFamily { None, V4, V6 };

using Ipv6Segments = std::array<std::uint16_t, 8>;

/// Strict dotted-quad parse to a host-order integer.
[[nodiscard]] std::optional<std::uint32_t> parse_ipv4(const std::string &text);
/// Any textual IPv6 form, including embedded IPv4 tails. A `%zone` suffix is ignored.
[[nodiscard]] std::optional<Ipv6Segments> parse_ipv6(const std::string &text);

/// Strips surrounding brackets and a trailing dot, then lowercases.
[[nodiscard]] std::string normalize_hostname(const std::string &host);
[[nodiscard]] IpFamily ip_family(const std::string &host);
[[nodiscard]] bool is_ip_literal(const std::string &host);

/// The IPv4 address wrapped in `::ffff:a.b.c.d` / `::ffff:hhhh:hhhh`, if any.
[[nodiscard]] std::optional<std::uint32_t> mapped_ipv4(const Ipv6Segments &segments);
[[nodiscard]] std::string format_ipv4(std::uint32_t address);

[[nodiscard]] bool is_private_or_reserved_ipv4(std::uint32_t address);
[[nodiscard]] bool is_private_or_reserved_ipv6(const Ipv6Segments &segments);

/// True for any non-public address, and for anything that does not parse as an address.
[[nodiscard]] bool is_private_or_reserved(const std::string &address);

} // namespace clawguard::net
