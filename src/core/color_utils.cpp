// Copyright 2026 The boardkit Authors

#include "core/color_utils.h"

#include <cstdio>
#include <cstring>

namespace boardkit {
namespace internal {

void ColorToHex(uint32_t argb, char* buf, int buf_size, bool include_alpha) {
  if (!buf || buf_size < 2) return;

  if (include_alpha) {
    if (buf_size >= 10) {
      std::snprintf(buf, buf_size, "#%02X%02X%02X%02X", ColorRed(argb),
                    ColorGreen(argb), ColorBlue(argb), ColorAlpha(argb));
    }
  } else if (buf_size >= 8) {
    std::snprintf(buf, buf_size, "#%02X%02X%02X", ColorRed(argb),
                  ColorGreen(argb), ColorBlue(argb));
  }
}

std::string ColorToHex(uint32_t argb, bool include_alpha) {
  char buf[16] = {};
  ColorToHex(argb, buf, sizeof(buf), include_alpha);
  return buf;
}

namespace {

// Value of one hex digit, or -1.
int HexCharToVal(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Two hex digits starting at p, or -1.
int HexByte(const char* p) {
  int hi = HexCharToVal(p[0]);
  int lo = HexCharToVal(p[1]);
  if (hi < 0 || lo < 0) return -1;
  return hi * 16 + lo;
}

}  // namespace

bool ColorFromHex(const char* hex, uint32_t* out_argb) {
  if (!hex || !out_argb) return false;
  if (hex[0] == '#') ++hex;

  size_t len = std::strlen(hex);
  if (len == 3) {
    int r = HexCharToVal(hex[0]);
    int g = HexCharToVal(hex[1]);
    int b = HexCharToVal(hex[2]);
    if (r < 0 || g < 0 || b < 0) return false;
    *out_argb = MakeArgb(0xFF, static_cast<uint8_t>(r * 17),
                         static_cast<uint8_t>(g * 17),
                         static_cast<uint8_t>(b * 17));
    return true;
  }

  if (len == 6 || len == 8) {
    int r = HexByte(hex);
    int g = HexByte(hex + 2);
    int b = HexByte(hex + 4);
    int a = len == 8 ? HexByte(hex + 6) : 0xFF;
    if (r < 0 || g < 0 || b < 0 || a < 0) return false;
    *out_argb = MakeArgb(static_cast<uint8_t>(a), static_cast<uint8_t>(r),
                         static_cast<uint8_t>(g), static_cast<uint8_t>(b));
    return true;
  }

  return false;
}

std::optional<uint32_t> ColorFromHex(const std::string& hex) {
  uint32_t argb = 0;
  if (!ColorFromHex(hex.c_str(), &argb)) return std::nullopt;
  return argb;
}

}  // namespace internal
}  // namespace boardkit
