#pragma once

#include <stdint.h>
#include <string.h>

#include "types.h"

namespace lc {

// Two-line status screen. The core only ever writes to it.
class StatusDisplay {
 public:
  virtual ~StatusDisplay() {}

  virtual void showStatus(OperatingMode mode, const char* line1, const char* line2) = 0;
  virtual void powerOff() = 0;
};

// Built-in 5x7 font cell, scaled by the text size.
constexpr uint8_t kGlyphWidthPx = 6;

// Largest text size, up to max_size, that keeps `text` on one row of
// width_px pixels. Never below 1.
inline uint8_t fitTextSize(const char* text, uint16_t width_px, uint8_t max_size) {
  const size_t len = (text != nullptr) ? strlen(text) : 0;
  uint8_t size = max_size;
  while (size > 1 && len * kGlyphWidthPx * size > width_px) {
    --size;
  }
  return (size == 0) ? 1 : size;
}

}  // namespace lc
