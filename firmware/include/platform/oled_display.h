#pragma once

#include <Adafruit_GFX.h>
#include <Adafruit_SSD1306.h>
#include <Wire.h>

#include "display/status_display.h"

namespace lc {

// SSD1306 128x64 over I2C. Mode name on top, two large text lines below.
class OledStatusDisplay : public StatusDisplay {
 public:
  OledStatusDisplay(TwoWire& wire, uint8_t address, uint8_t width, uint8_t height);

  bool begin();

  void showStatus(OperatingMode mode, const char* line1, const char* line2) override;
  void powerOff() override;

 private:
  static constexpr size_t kLineCapacity = 17;

  Adafruit_SSD1306 oled_;
  uint8_t address_;
  bool ready_;
  bool powered_;

  OperatingMode shown_mode_;
  char shown_line1_[kLineCapacity];
  char shown_line2_[kLineCapacity];

  bool sameAsShown(OperatingMode mode, const char* line1, const char* line2) const;
};

}  // namespace lc
