#ifndef MCPDISPATCH_UTF8_SANITIZE_HPP
#define MCPDISPATCH_UTF8_SANITIZE_HPP

// Provider processes write arbitrary bytes to stdout/stderr. nlohmann/json
// refuses to dump invalid UTF-8, so captured text passes through here first.

#include <string>

namespace utf8_sanitize {

// Replaces invalid UTF-8 sequences (broken multibyte, invalid bytes) with U+FFFD.
// In-place version.
void sanitize(std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

// Cuts text to at most maximum_bytes without splitting a multibyte sequence.
// Appends a marker when something was cut.
std::string truncate(const std::string &text, size_t maximum_bytes);

} // namespace utf8_sanitize

#endif // MCPDISPATCH_UTF8_SANITIZE_HPP
