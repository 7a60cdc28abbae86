#pragma once

#include <stdint.h>

#include "app/calibration_console.h"
#include "app/control_context.h"
#include "app/fault_handler.h"
#include "calibration.h"
#include "config.h"
#include "display/status_display.h"
#include "hal/clock.h"
#include "hal/stepper_28byj48.h"
#include "log.h"
#include "sensors/presence_detector.h"
#include "types.h"

namespace lc {

struct SchedulerConfig {
  uint32_t action_after_ms = kActionAfterMs;
  uint32_t presence_interval_ms = kPollingIntervalPresenceMs;
  uint32_t standby_interval_ms = kPollingIntervalStandbyMs;
  uint16_t lid_revolutions = kLidRevolutions;
  uint32_t step_sleep_open_us = kStepSleepOpenUs;
  uint32_t step_sleep_close_us = kStepSleepCloseUs;
  StepDirection close_direction = LID_CLOSE_DIRECTION;
};

// Runs the active mode's loop on the main flow.
//
// Each loop checks the shared context at its top and hands control back
// to serviceMode() as soon as a mode switch is observed. Nested loops
// check the flag themselves; nothing unwinds more than one level on its
// own.
class Scheduler {
 public:
  Scheduler(ControlContext& context,
            PresenceDetector& presence,
            Stepper28BYJ48& stepper,
            StatusDisplay& display,
            Clock& clock,
            FaultHandler& faults,
            Logger& log,
            const SchedulerConfig& config);

  // Optional; CALIBRATION only shows sensor readings without it.
  void setConsole(CalibrationConsole* console);

  // Top-level dispatcher: one call runs one mode until it is left.
  void serviceMode();

  void runAutomatic();
  void runManual();
  void runCalibration();

  // Close action. Returns false if it was interrupted.
  bool closeLid();

  uint32_t closeCount() const;
  uint32_t lastCloseStartMs() const;
  const ActuationResult& lastActuation() const;

 private:
  ControlContext& context_;
  PresenceDetector& presence_;
  Stepper28BYJ48& stepper_;
  StatusDisplay& display_;
  Clock& clock_;
  FaultHandler& faults_;
  Logger& log_;
  CalibrationConsole* console_;
  SchedulerConfig config_;

  uint32_t close_count_;
  uint32_t last_close_start_ms_;
  ActuationResult last_actuation_;

  bool checkpoint();
  // Returns true if a mode switch ended tracking.
  bool trackPresence();
  void unwind(StepDirection direction, uint32_t steps);
  uint32_t stepDelayFor(StepDirection direction) const;
  void showCalibrationReadings();
};

}  // namespace lc
