#include "test_framework.hpp"

#include "clawguard/net/url.hpp"
#include "clawguard/security/url_safety.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>

void register_url_safety_tests(std::vector<clawguard::tests::TestCase> &tests) {
  using clawguard::tests::require;
  namespace s = clawguard::security;
  using clawguard::testing::FakeDnsResolver;
  using namespace std::chrono_literals;

  tests.push_back({"url_safety_static_checks", [] {
                     const s::UrlSafetyValidator validator(std::make_shared<FakeDnsResolver>());
                     require(validator.is_allowed_url("https://example.com/page"), "plain https");
                     require(validator.is_allowed_url("http://8.8.8.8/"), "public IP literal");
                     require(!validator.is_allowed_url("ftp://example.com/file"), "ftp rejected");
                     require(!validator.is_allowed_url("file:///etc/passwd"), "file rejected");
                     require(!validator.is_allowed_url("http://localhost:8080/"), "localhost");
                     require(!validator.is_allowed_url("http://api.localhost/"), "*.localhost");
                     require(!validator.is_allowed_url("http://LOCALHOST./"), "normalized localhost");
                     require(!validator.is_allowed_url("http://127.0.0.1/"), "loopback literal");
                     require(!validator.is_allowed_url("http://[::1]:8080/"), "v6 loopback literal");
                     require(!validator.is_allowed_url("http://[::ffff:169.254.169.254]/"),
                             "mapped metadata address");
                     require(!validator.is_allowed_url("not a url"), "garbage");

                     const auto check = validator.check_url("gopher://example.com/");
                     require(check.rejection == s::UrlRejection::Scheme, "scheme rejection kind");
                   }});

  tests.push_back({"url_safety_resolution_requires_every_address_public", [] {
                     auto resolver = std::make_shared<FakeDnsResolver>();
                     resolver->add("good.example", {"93.184.216.34", "2606:2800:220:1::1"});
                     resolver->add("mixed.example", {"93.184.216.34", "10.0.0.7"});
                     resolver->add("empty.example", {});
                     const s::UrlSafetyValidator validator(resolver);

                     require(validator.resolves_to_public_addresses("good.example", 500ms), "good");
                     require(!validator.resolves_to_public_addresses("mixed.example", 500ms),
                             "one private address rejects the host");
                     require(!validator.resolves_to_public_addresses("empty.example", 500ms),
                             "empty answer rejected");
                     require(!validator.resolves_to_public_addresses("missing.example", 500ms),
                             "resolver error rejected");

                     const auto mixed = validator.check_resolution("mixed.example", 500ms);
                     require(mixed.rejection == s::UrlRejection::PrivateAddress, "private kind");
                     require(mixed.reason.find("10.0.0.7") != std::string::npos,
                             "reason names the address");
                   }});

  tests.push_back({"url_safety_dns_timeout_is_rejection", [] {
                     auto resolver = std::make_shared<FakeDnsResolver>();
                     resolver->time_out("slow.example");
                     const s::UrlSafetyValidator validator(resolver);

                     const auto check = validator.check_resolution("slow.example", 50ms);
                     require(!check.allowed(), "timeout must reject");
                     require(check.rejection == s::UrlRejection::Resolution, "resolution kind");
                     require(check.reason.find("timed out") != std::string::npos, check.reason);
                   }});

  tests.push_back({"url_safety_public_destination_combines_checks", [] {
                     auto resolver = std::make_shared<FakeDnsResolver>();
                     resolver->add("rebind.example", {"127.0.0.1"});
                     resolver->add("docs.example", {"151.101.1.1"});
                     const s::UrlSafetyValidator validator(resolver);

                     require(validator.check_public_destination("https://docs.example/a", 500ms).allowed(),
                             "public destination");
                     require(!validator.check_public_destination("https://rebind.example/", 500ms).allowed(),
                             "rebinding host");
                     require(resolver->lookups() == 2, "both hosts looked up");
                     require(!validator.check_public_destination("http://10.1.2.3/", 500ms).allowed(),
                             "private literal");
                     require(resolver->lookups() == 2, "literal needs no lookup");
                   }});

  tests.push_back({"system_resolver_caps_lookups_in_flight", [] {
                     auto saturated = std::make_shared<s::SystemDnsResolver>(0);
                     const auto refused = saturated->resolve("example.com", 100ms);
                     require(!refused.ok(), "no slot left");
                     require(refused.kind() == clawguard::common::ErrorKind::Resolution,
                             "resolution error, not a timeout");
                     require(refused.error().find("in flight") != std::string::npos, refused.error());
                     require(saturated->in_flight() == 0, "refused lookup holds no slot");

                     const s::UrlSafetyValidator validator(saturated);
                     require(!validator.resolves_to_public_addresses("example.com", 100ms),
                             "refusal is a rejection");
                   }});

  tests.push_back({"url_parse_and_resolve", [] {
                     namespace n = clawguard::net;
                     const auto parsed = n::parse_url("HTTPS://Docs.Example.COM:8443/a/b?q=1");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().scheme == "https", "scheme lowered");
                     require(parsed.value().host == "docs.example.com", parsed.value().host);
                     require(parsed.value().port == "8443", "port");

                     const auto relative = n::resolve_url("https://example.com/a/b", "../c");
                     require(relative.ok() && relative.value() == "https://example.com/c",
                             relative.ok() ? relative.value() : relative.error());
                     const auto absolute = n::resolve_url("https://example.com/a", "http://other.example/x");
                     require(absolute.ok() && absolute.value() == "http://other.example/x", "absolute");

                     const auto urls = n::extract_urls(
                         "curl -s 'https://api.github.com/repos' && wget http://evil.example/x;");
                     require(urls.size() == 2, "two urls");
                     require(urls[0] == "https://api.github.com/repos", urls[0]);
                     require(urls[1] == "http://evil.example/x", urls[1]);
                   }});
}
