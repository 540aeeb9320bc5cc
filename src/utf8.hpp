#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>

inline constexpr const char SEPARATORS[] = " !@#$%^&*()_+=-[]{}'\"\\|,.<>?/`~";

inline bool Utf8_IsContinuation(uint8_t byte) {
  return (byte & 0xC0) == 0x80;
}

// Appends the UTF-8 encoding of `codepoint`; false for surrogates and values
// outside the Unicode range
inline bool Utf8_Encode(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x00'0080) {
    out += char(codepoint & 0x7F);
  } else if (codepoint < 0x00'0800) {
    out += char(((codepoint >> 6) & 0x1F) | 0xC0);
    out += char(((codepoint >> 0) & 0x3F) | 0x80);
  } else if (codepoint < 0x01'0000) {
    if (0xD800 <= codepoint && codepoint < 0xE000) {
      return false;
    }
    out += char(((codepoint >> 12) & 0x0F) | 0xE0);
    out += char(((codepoint >> 6) & 0x3F) | 0x80);
    out += char(((codepoint >> 0) & 0x3F) | 0x80);
  } else if (codepoint < 0x11'0000) {
    out += char(((codepoint >> 18) & 0x07) | 0xF0);
    out += char(((codepoint >> 12) & 0x3F) | 0x80);
    out += char(((codepoint >> 6) & 0x3F) | 0x80);
    out += char(((codepoint >> 0) & 0x3F) | 0x80);
  } else {
    return false;
  }
  return true;
}

struct EditableUtf8String {
  std::string buf;
  // Byte offset, always on a codepoint boundary
  size_t offCursor = 0;

  EditableUtf8String() {}
  EditableUtf8String(const std::string &s) : buf(s), offCursor(s.size()) {}
  EditableUtf8String(const std::string &s, size_t offCursor)
      : buf(s), offCursor(std::min(offCursor, s.size())) {}

  bool Insert(uint32_t codepoint) {
    std::string encoded;
    if (!Utf8_Encode(encoded, codepoint)) {
      return false;
    }
    buf.insert(offCursor, encoded);
    offCursor += encoded.size();
    return true;
  }

  void Set(const std::string &s) {
    buf = s;
    offCursor = buf.size();
  }

  void Clear() {
    buf.clear();
    offCursor = 0;
  }

  // Backspace
  bool DeleteChar() {
    if (offCursor == 0) {
      return false;
    }
    auto offPrev = PrevCodepoint(offCursor);
    buf.erase(offPrev, offCursor - offPrev);
    offCursor = offPrev;
    return true;
  }

  bool DeleteForward() {
    if (offCursor == buf.size()) {
      return false;
    }
    auto offNext = NextCodepoint(offCursor);
    buf.erase(offCursor, offNext - offCursor);
    return true;
  }

  bool DeleteWord() {
    if (offCursor == 0) {
      return false;
    }
    auto offEnd = offCursor;
    PreviousBoundary();
    buf.erase(offCursor, offEnd - offCursor);
    return true;
  }

  void Left() { offCursor = PrevCodepoint(offCursor); }
  void Right() { offCursor = NextCodepoint(offCursor); }
  void Home() { offCursor = 0; }
  void End() { offCursor = buf.size(); }

  // Moves to the next separator after the cursor, or the end
  void NextBoundary() {
    auto offStart = std::min(buf.size(), offCursor + 1);
    auto off = buf.find_first_of(SEPARATORS, offStart);
    offCursor = off == std::string::npos ? buf.size() : off;
  }

  // Moves to the closest separator before the cursor, or the start
  void PreviousBoundary() {
    if (offCursor == 0) {
      return;
    }
    auto off = buf.find_last_of(SEPARATORS, offCursor - 1);
    offCursor = off == std::string::npos ? 0 : off;
  }

  const char *c_str() const { return buf.c_str(); }
  const std::string &str() const { return buf; }
  bool IsEmpty() const { return buf.empty(); }

 private:
  size_t PrevCodepoint(size_t off) const {
    if (off == 0) {
      return 0;
    }
    off--;
    while (off > 0 && Utf8_IsContinuation(uint8_t(buf[off]))) {
      off--;
    }
    return off;
  }

  size_t NextCodepoint(size_t off) const {
    if (off >= buf.size()) {
      return buf.size();
    }
    off++;
    while (off < buf.size() && Utf8_IsContinuation(uint8_t(buf[off]))) {
      off++;
    }
    return off;
  }
};
