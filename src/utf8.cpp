/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 conversion helpers.
 */

#include "utf8.h"

#include "error.h"

#include <cstdio>

namespace unicsv {

size_t utf8_decode(std::string_view str, size_t pos, char32_t& codepoint) {
  if (pos >= str.size()) {
    return 0;
  }

  uint8_t byte = static_cast<uint8_t>(str[pos]);

  // ASCII (0xxxxxxx)
  if ((byte & 0x80) == 0) {
    codepoint = byte;
    return 1;
  }

  // Determine sequence length and initial bits
  size_t len;
  char32_t cp;

  if ((byte & 0xE0) == 0xC0) {
    // Two-byte sequence (110xxxxx)
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    // Three-byte sequence (1110xxxx)
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    // Four-byte sequence (11110xxx)
    len = 4;
    cp = byte & 0x07;
  } else {
    // Invalid leading byte or stray continuation byte
    return 0;
  }

  if (pos + len > str.size()) {
    return 0;
  }

  // Decode continuation bytes (10xxxxxx)
  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      return 0;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
    return 0;
  }

  if (!is_unicode_scalar(cp)) {
    return 0;
  }

  codepoint = cp;
  return len;
}

size_t utf8_append(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
    return 1;
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return 2;
  } else if (cp < 0x10000) {
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return 3;
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return 4;
  }
  return 0;
}

std::string to_utf8(std::u32string_view str) {
  std::string out;
  out.reserve(str.size());
  for (char32_t cp : str) {
    utf8_append(out, cp);
  }
  return out;
}

std::u32string from_utf8(std::string_view str) {
  std::u32string out;
  out.reserve(str.size());
  size_t pos = 0;
  while (pos < str.size()) {
    char32_t cp = 0;
    size_t len = utf8_decode(str, pos, cp);
    if (len == 0) {
      throw CsvException(CsvError(ErrorCode::INVALID_UTF8,
                                  "Invalid UTF-8 sequence in field text",
                                  "Field text must be valid UTF-8.")
                             .with_offset(pos));
    }
    out.push_back(cp);
    pos += len;
  }
  return out;
}

std::string escape_scalars(std::u32string_view str) {
  std::string out;
  for (char32_t cp : str) {
    switch (cp) {
    case U'\n':
      out += "\\n";
      break;
    case U'\r':
      out += "\\r";
      break;
    case U'\t':
      out += "\\t";
      break;
    default:
      if (cp < 0x20 || cp == 0x7F) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(cp));
        out += buf;
      } else {
        utf8_append(out, cp);
      }
      break;
    }
  }
  return out;
}

} // namespace unicsv
