#pragma once

#include <cstdio>
#include <string>

// Alphabet character as it should appear in a message: backslash escaped,
// anything unprintable as a \xNN code.
inline std::string makePrintable(char c) {
  auto byte = static_cast<unsigned char>(c);
  if (c == '\\') return "\\\\";
  if (byte >= 0x20 && byte < 0x7f) return std::string(1, c);
  char buf[8];
  std::snprintf(buf, sizeof buf, "\\x%02x", byte);
  return buf;
}
