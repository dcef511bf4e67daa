#include "test_framework.hpp"

#include "clawguard/security/domain_allowlist.hpp"

void register_allowlist_tests(std::vector<clawguard::tests::TestCase> &tests) {
  using clawguard::tests::require;
  namespace s = clawguard::security;

  tests.push_back({"allowlist_wildcard_semantics", [] {
                     const std::vector<std::string> patterns = {"*.example.com"};
                     require(s::is_domain_allowed("api.example.com", patterns), "one label");
                     require(s::is_domain_allowed("a.b.example.com", patterns), "two labels");
                     require(!s::is_domain_allowed("example.com", patterns), "bare domain");
                     require(!s::is_domain_allowed("evilexample.com", patterns), "suffix trick");
                     require(!s::is_domain_allowed("example.com.evil.net", patterns), "prefix trick");
                   }});

  tests.push_back({"allowlist_exact_case_and_question_mark", [] {
                     require(s::is_domain_allowed("GitHub.com", {"github.com"}), "case-insensitive");
                     require(!s::is_domain_allowed("api.github.com", {"github.com"}), "exact only");
                     require(s::is_domain_allowed("cdn1.example.org", {"cdn?.example.org"}), "?");
                     require(!s::is_domain_allowed("cdn12.example.org", {"cdn?.example.org"}),
                             "? matches one character");
                     require(!s::is_domain_allowed("githubXcom", {"github.com"}), "dot is literal");
                   }});

  tests.push_back({"allowlist_empty_denies_everything", [] {
                     require(!s::is_domain_allowed("github.com", {}), "empty list");
                     const s::DomainAllowlist empty;
                     require(!empty.is_allowed("github.com"), "empty allowlist object");
                   }});

  tests.push_back({"allowlist_agent_overrides_extend_base", [] {
                     const s::DomainAllowlist allowlist(
                         {"github.com"}, {{"researcher", {"*.wikipedia.org"}}});
                     require(allowlist.is_allowed("github.com", std::string("researcher")),
                             "base still applies to the agent");
                     require(allowlist.is_allowed("en.wikipedia.org", std::string("researcher")),
                             "override adds a domain");
                     require(!allowlist.is_allowed("en.wikipedia.org", std::string("coder")),
                             "other agents do not get it");
                     require(!allowlist.is_allowed("en.wikipedia.org"), "no agent");
                     require(allowlist.patterns_for(std::string("researcher")).size() == 2,
                             "union of patterns");
                   }});
}
