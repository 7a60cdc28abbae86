#pragma once

#include <stddef.h>
#include <stdint.h>

#include "app/control_context.h"
#include "hal/stepper_28byj48.h"
#include "log.h"
#include "sensors/presence_detector.h"

namespace lc {

class LineReader {
 public:
  virtual ~LineReader() {}

  // Copies one complete, NUL-terminated line into buffer. False if no
  // full line is available yet.
  virtual bool readLine(char* buffer, size_t capacity) = 0;
};

// Manual stepper commands accepted while in CALIBRATION mode.
class CalibrationConsole {
 public:
  CalibrationConsole(LineReader& input,
                     Stepper28BYJ48& stepper,
                     PresenceDetector& presence,
                     ControlContext& context,
                     Logger& log,
                     uint32_t jog_step_delay_us);

  // Handles at most one pending line. Returns true if a line was read.
  bool poll();
  void handleCommand(char* line);

  const ActuationResult& lastJog() const;

 private:
  static constexpr size_t kLineCapacity = 48;

  LineReader& input_;
  Stepper28BYJ48& stepper_;
  PresenceDetector& presence_;
  ControlContext& context_;
  Logger& log_;
  uint32_t jog_step_delay_us_;

  char line_[kLineCapacity];
  ActuationResult last_jog_;

  void printHelp();
  void printStatus();
  void handleJog(char* steps_arg);
};

}  // namespace lc
