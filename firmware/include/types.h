#pragma once

#include <stdint.h>

namespace lc {

enum class OperatingMode : uint8_t {
  AUTOMATIC = 0,
  MANUAL,
  CALIBRATION
};

enum class StepDirection : uint8_t {
  FORWARD = 0,
  REVERSE
};

enum class FaultCode : uint8_t {
  NONE = 0,
  INVALID_MODE,
  INVALID_DIRECTION
};

struct ActuationRequest {
  StepDirection direction = StepDirection::FORWARD;
  uint32_t step_count = 0;
  uint32_t step_delay_us = 0;
};

struct ActuationResult {
  bool completed = false;
  uint32_t steps_executed = 0;
};

struct PresenceSample {
  uint16_t brightness = 0;
  float distance_cm = 0.0f;
  bool distance_valid = false;
  bool bright = false;
  bool motion = false;
  bool present = false;
  uint32_t ts_ms = 0;
};

inline const char* faultName(FaultCode code) {
  switch (code) {
    case FaultCode::NONE:
      return "none";
    case FaultCode::INVALID_MODE:
      return "state_machine_error";
    case FaultCode::INVALID_DIRECTION:
      return "invalid_direction";
    default:
      return "unknown_fault";
  }
}

inline StepDirection oppositeDirection(StepDirection direction) {
  return (direction == StepDirection::FORWARD) ? StepDirection::REVERSE
                                               : StepDirection::FORWARD;
}

}  // namespace lc
