#pragma once

#include <cstddef>
#include <string>

namespace sentinel {
namespace utf8 {

// Largest offset <= pos that does not fall inside a multi-byte sequence.
// Steps back over at most three continuation bytes; pos past the end
// returns text.size().
std::size_t Boundary(const std::string& text, std::size_t pos);

// Copy of text with every byte that is not part of a well-formed UTF-8
// sequence replaced by U+FFFD.
std::string Sanitize(const std::string& text);

// Sanitize(text) cut to at most max_bytes without splitting a character.
std::string Truncate(const std::string& text, std::size_t max_bytes);

}  // namespace utf8
}  // namespace sentinel
