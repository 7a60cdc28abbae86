#include "platform/oled_display.h"

#include <string.h>

#include "app/state_machine.h"

namespace lc {
namespace {

constexpr uint8_t kLineTextSize = 2;

}  // namespace

OledStatusDisplay::OledStatusDisplay(TwoWire& wire, uint8_t address, uint8_t width, uint8_t height)
    : oled_(width, height, &wire, -1),
      address_(address),
      ready_(false),
      powered_(false),
      shown_mode_(OperatingMode::AUTOMATIC),
      shown_line1_(),
      shown_line2_() {}

bool OledStatusDisplay::begin() {
  ready_ = oled_.begin(SSD1306_SWITCHCAPVCC, address_);
  if (!ready_) {
    return false;
  }
  // The panel comes up on after begin().
  powered_ = true;
  powerOff();
  return true;
}

void OledStatusDisplay::showStatus(OperatingMode mode, const char* line1, const char* line2) {
  if (!ready_) {
    return;
  }

  if (line1 == nullptr) {
    line1 = "";
  }
  if (line2 == nullptr) {
    line2 = "";
  }

  // Avoid hammering I2C: redraw only when the content changed.
  if (powered_ && sameAsShown(mode, line1, line2)) {
    return;
  }

  if (!powered_) {
    oled_.ssd1306_command(SSD1306_DISPLAYON);
    powered_ = true;
  }

  oled_.clearDisplay();
  oled_.setTextWrap(false);
  oled_.setTextColor(SSD1306_WHITE);
  oled_.setTextSize(1);
  oled_.setCursor(0, 0);
  oled_.print(modeName(mode));
  oled_.setTextSize(fitTextSize(line1, oled_.width(), kLineTextSize));
  oled_.setCursor(0, 20);
  oled_.print(line1);
  oled_.setTextSize(fitTextSize(line2, oled_.width(), kLineTextSize));
  oled_.setCursor(0, 44);
  oled_.print(line2);
  oled_.display();

  shown_mode_ = mode;
  strncpy(shown_line1_, line1, kLineCapacity - 1);
  shown_line1_[kLineCapacity - 1] = '\0';
  strncpy(shown_line2_, line2, kLineCapacity - 1);
  shown_line2_[kLineCapacity - 1] = '\0';
}

void OledStatusDisplay::powerOff() {
  if (!ready_ || !powered_) {
    return;
  }
  oled_.clearDisplay();
  oled_.display();
  oled_.ssd1306_command(SSD1306_DISPLAYOFF);
  powered_ = false;
}

bool OledStatusDisplay::sameAsShown(OperatingMode mode, const char* line1, const char* line2) const {
  return mode == shown_mode_ && strncmp(shown_line1_, line1, kLineCapacity - 1) == 0 &&
         strncmp(shown_line2_, line2, kLineCapacity - 1) == 0;
}

}  // namespace lc
