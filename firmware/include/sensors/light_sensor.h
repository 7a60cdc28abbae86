#pragma once

#include <stdint.h>

#include "hal/digital_io.h"

namespace lc {

// SFH 300 phototransistor on an analog input.
class LightSensor {
 public:
  LightSensor(DigitalIo& io, uint8_t pin);

  uint16_t readBrightness();
  uint16_t lastBrightness() const;

 private:
  DigitalIo& io_;
  uint8_t pin_;
  uint16_t last_brightness_;
};

}  // namespace lc
