#pragma once

#include <stdint.h>

#include "app/control_context.h"
#include "hal/clock.h"
#include "hal/digital_io.h"
#include "log.h"
#include "types.h"

namespace lc {

// Open-loop driver for a 28BYJ-48 behind a ULN2003, one coil per step.
//
// actuate() blocks for the whole sequence and polls the shared abort flag
// before every step. Coils are de-energized before and after every
// sequence, including aborted ones. Nothing moves while a fault is latched.
class Stepper28BYJ48 {
 public:
  static constexpr uint8_t kPhaseCount = 4;

  Stepper28BYJ48(DigitalIo& io,
                 Clock& clock,
                 ControlContext& context,
                 const uint8_t (&pins)[kPhaseCount],
                 uint32_t steps_per_revolution);

  void setLogger(Logger* log);

  ActuationResult actuate(const ActuationRequest& request);
  ActuationResult actuate(StepDirection direction,
                          uint16_t revolutions,
                          uint32_t step_delay_us);

  void deEnergize();
  bool isEnergized() const;

  // Signed step count since boot: FORWARD +1, REVERSE -1.
  int32_t positionSteps() const;
  void resetPositionSteps(int32_t steps = 0);

  uint32_t stepsPerRevolution() const;

 private:
  DigitalIo& io_;
  Clock& clock_;
  ControlContext& context_;
  Logger* log_;

  uint8_t pins_[kPhaseCount];
  uint32_t steps_per_revolution_;

  uint8_t phase_index_;
  bool energized_;
  int32_t position_steps_;

  void applyPhase(uint8_t phase);
  void logResult(const ActuationRequest& request, const ActuationResult& result);
};

}  // namespace lc
