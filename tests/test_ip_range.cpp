#include "test_framework.hpp"

#include "clawguard/net/ip_range.hpp"

void register_ip_range_tests(std::vector<clawguard::tests::TestCase> &tests) {
  using clawguard::tests::require;
  namespace n = clawguard::net;

  tests.push_back({"ip_range_private_ipv4_ranges", [] {
                     for (const char *address :
                          {"0.0.0.0", "10.0.0.1", "10.255.255.255", "100.64.0.1", "100.127.255.255",
                           "127.0.0.1", "169.254.169.254", "172.16.0.1", "172.31.255.255",
                           "192.168.1.1", "198.18.0.1", "198.19.255.255", "224.0.0.1",
                           "255.255.255.255"}) {
                       require(n::is_private_or_reserved(address),
                               std::string(address) + " should be non-public");
                     }
                   }});

  tests.push_back({"ip_range_public_ipv4_addresses", [] {
                     for (const char *address : {"1.1.1.1", "8.8.8.8", "100.63.255.255", "100.128.0.0",
                                                 "172.15.255.255", "172.32.0.0", "198.17.255.255",
                                                 "198.20.0.0", "223.255.255.255", "140.82.112.3"}) {
                       require(!n::is_private_or_reserved(address),
                               std::string(address) + " should be public");
                     }
                   }});

  tests.push_back({"ip_range_ipv6_ranges", [] {
                     require(n::is_private_or_reserved("::1"), "loopback");
                     require(n::is_private_or_reserved("::"), "unspecified");
                     require(n::is_private_or_reserved("fc00::1"), "unique local fc");
                     require(n::is_private_or_reserved("fd12:3456::1"), "unique local fd");
                     require(n::is_private_or_reserved("fe80::1"), "link local");
                     require(n::is_private_or_reserved("febf::1"), "link local upper bound");
                     require(n::is_private_or_reserved("fec0::1"), "site local");
                     require(n::is_private_or_reserved("ff02::1"), "multicast");
                     require(n::is_private_or_reserved("[::1]"), "bracketed loopback");
                     require(!n::is_private_or_reserved("2606:4700:4700::1111"), "public v6");
                     require(!n::is_private_or_reserved("2001:4860:4860::8888"), "public v6 google");
                   }});

  tests.push_back({"ip_range_mapped_ipv6_matches_ipv4", [] {
                     for (const char *v4 : {"127.0.0.1", "10.0.0.5", "169.254.169.254", "8.8.8.8",
                                            "1.1.1.1", "192.168.0.1"}) {
                       const std::string dotted = std::string("::ffff:") + v4;
                       require(n::is_private_or_reserved(dotted) == n::is_private_or_reserved(v4),
                               dotted + " must classify like " + v4);
                     }
                     require(n::is_private_or_reserved("::ffff:7f00:1"), "hex mapped loopback");
                     require(!n::is_private_or_reserved("::ffff:808:808"), "hex mapped 8.8.8.8");
                     require(n::is_private_or_reserved("::FFFF:A9FE:A9FE"), "uppercase hex mapped");
                   }});

  tests.push_back({"ip_range_zone_suffix_ignored", [] {
                     require(n::is_private_or_reserved("fe80::1%eth0"), "zoned link local");
                     require(n::parse_ipv6("fe80::1%eth0").has_value(), "zone should parse");
                   }});

  tests.push_back({"ip_range_invalid_text_is_non_public", [] {
                     for (const char *text : {"", "not-an-ip", "256.1.1.1", "1.2.3", "1.2.3.4.5",
                                              "01.2.3.4x", "::ffff:1.2.3", "1:2:3:4:5:6:7:8:9"}) {
                       require(n::is_private_or_reserved(text),
                               std::string("'") + text + "' should be treated as non-public");
                     }
                   }});

  tests.push_back({"ip_range_literal_detection", [] {
                     require(n::ip_family("1.2.3.4") == n::IpFamily::V4, "v4 family");
                     require(n::ip_family("[2001:db8::1]") == n::IpFamily::V6, "v6 family");
                     require(n::ip_family("example.com") == n::IpFamily::None, "hostname");
                     require(n::normalize_hostname("[::1]") == "::1", "brackets stripped");
                     require(n::normalize_hostname("GitHub.COM.") == "github.com",
                             "case and trailing dot");
                     require(n::format_ipv4(0x7F000001U) == "127.0.0.1", "format");
                   }});
}
