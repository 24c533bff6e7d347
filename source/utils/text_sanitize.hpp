#ifndef SMCPC_TEXT_SANITIZE_HPP
#define SMCPC_TEXT_SANITIZE_HPP

// Makes raw bytes read from a child process safe to put in a log line.

#include <cstddef>
#include <string>

namespace text_sanitize {

// Default cap for excerpts of child output.
constexpr size_t DEFAULT_EXCERPT_LENGTH = 512;

// Returns true if text is well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(const std::string &text);

// Returns a single-line, valid UTF-8 rendition of raw:
// invalid sequences become U+FFFD, control characters other than tab are
// written as \n, \r or \xHH, and output longer than maximum_length bytes is
// cut at a character boundary and suffixed with "...".
std::string printable_excerpt(const std::string &raw, size_t maximum_length = DEFAULT_EXCERPT_LENGTH);

} // namespace text_sanitize

#endif // SMCPC_TEXT_SANITIZE_HPP
