#include "server/text/utf8.h"

namespace sentinel {
namespace utf8 {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the well-formed sequence starting at text[i], or 0.
std::size_t SequenceLength(const std::string& text, std::size_t i) {
  auto lead = static_cast<unsigned char>(text[i]);
  if (lead < 0x80) {
    return 1;
  }
  std::size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
    if (lead == 0xE0) lo = 0xA0;  // Overlong.
    if (lead == 0xED) hi = 0x9F;  // Surrogates.
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
    if (lead == 0xF0) lo = 0x90;
    if (lead == 0xF4) hi = 0x8F;  // Above U+10FFFF.
  } else {
    return 0;
  }
  if (i + len > text.size()) {
    return 0;
  }
  auto second = static_cast<unsigned char>(text[i + 1]);
  if (second < lo || second > hi) {
    return 0;
  }
  for (std::size_t k = 2; k < len; ++k) {
    if (!IsContinuation(static_cast<unsigned char>(text[i + k]))) {
      return 0;
    }
  }
  return len;
}

}  // namespace

std::size_t Boundary(const std::string& text, std::size_t pos) {
  if (pos >= text.size()) {
    return text.size();
  }
  for (int steps = 0; steps < 3 && pos > 0 &&
                      IsContinuation(static_cast<unsigned char>(text[pos]));
       ++steps) {
    --pos;
  }
  return pos;
}

std::string Sanitize(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    std::size_t len = SequenceLength(text, i);
    if (len == 0) {
      out += kReplacement;
      ++i;
      continue;
    }
    out.append(text, i, len);
    i += len;
  }
  return out;
}

std::string Truncate(const std::string& text, std::size_t max_bytes) {
  return Sanitize(text.substr(0, Boundary(text, max_bytes)));
}

}  // namespace utf8
}  // namespace sentinel
