#pragma once

#include <string>

namespace clawguard::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

/// First 12 hex digits of the SHA-256 digest; enough to correlate log lines for the same
/// chunk without writing the chunk itself.
[[nodiscard]] std::string content_fingerprint(const std::string &text);

} // namespace clawguard::common
