#ifndef CLAWMCPS_UTF8_SANITIZE_HPP
#define CLAWMCPS_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Returns a copy of text where every byte that does not start a well-formed
// UTF-8 sequence (bad lead byte, truncated or broken multibyte sequence) is
// replaced by U+FFFD. nlohmann::json refuses to dump invalid UTF-8, and child
// process output is arbitrary bytes.
std::string sanitize(const std::string &text);

// True when text is already valid UTF-8 (sanitize would return it unchanged).
bool is_valid(const std::string &text);

} // namespace utf8_sanitize

#endif // CLAWMCPS_UTF8_SANITIZE_HPP
