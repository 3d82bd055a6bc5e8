// Copyright 2026 The boardkit Authors

#ifndef BOARDKIT_CORE_COLOR_UTILS_H_
#define BOARDKIT_CORE_COLOR_UTILS_H_

#include <cstdint>
#include <optional>
#include <string>

namespace boardkit {
namespace internal {

inline uint8_t ColorAlpha(uint32_t argb) { return (argb >> 24) & 0xFF; }
inline uint8_t ColorRed(uint32_t argb) { return (argb >> 16) & 0xFF; }
inline uint8_t ColorGreen(uint32_t argb) { return (argb >> 8) & 0xFF; }
inline uint8_t ColorBlue(uint32_t argb) { return argb & 0xFF; }

inline uint32_t MakeArgb(uint8_t a, uint8_t r, uint8_t g, uint8_t b) {
  return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
         (static_cast<uint32_t>(g) << 8) | b;
}

/// Format as "#RRGGBB", or "#RRGGBBAA" when include_alpha is true.
/// buf must be at least 10 bytes for the alpha form.
void ColorToHex(uint32_t argb, char* buf, int buf_size, bool include_alpha);
std::string ColorToHex(uint32_t argb, bool include_alpha = false);

/// Parse "#RGB", "#RRGGBB" or "#RRGGBBAA" (the '#' is optional).
/// Forms without alpha are fully opaque.
bool ColorFromHex(const char* hex, uint32_t* out_argb);
std::optional<uint32_t> ColorFromHex(const std::string& hex);

}  // namespace internal
}  // namespace boardkit

#endif  // BOARDKIT_CORE_COLOR_UTILS_H_
