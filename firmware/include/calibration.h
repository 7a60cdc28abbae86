#pragma once

#include <stdint.h>

#include "types.h"

namespace lc {

// Compile-time calibration placeholders. Update after mounting the motor.
constexpr StepDirection LID_CLOSE_DIRECTION = StepDirection::REVERSE;

// Phototransistor ADC counts are scaled to the 16-bit range the
// brightness threshold is expressed in (10-bit AVR ADC by default).
constexpr uint8_t LIGHT_ADC_BITS = 10;

inline uint16_t scaleAdcTo16Bit(uint16_t raw, uint8_t adc_bits) {
  if (adc_bits >= 16) {
    return raw;
  }
  return static_cast<uint16_t>(raw << (16 - adc_bits));
}

}  // namespace lc
