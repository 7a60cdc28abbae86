#include "app/scheduler.h"

#include <stdio.h>

#include "app/state_machine.h"

namespace lc {

Scheduler::Scheduler(ControlContext& context,
                     PresenceDetector& presence,
                     Stepper28BYJ48& stepper,
                     StatusDisplay& display,
                     Clock& clock,
                     FaultHandler& faults,
                     Logger& log,
                     const SchedulerConfig& config)
    : context_(context),
      presence_(presence),
      stepper_(stepper),
      display_(display),
      clock_(clock),
      faults_(faults),
      log_(log),
      console_(nullptr),
      config_(config),
      close_count_(0),
      last_close_start_ms_(0),
      last_actuation_() {}

void Scheduler::setConsole(CalibrationConsole* console) { console_ = console; }

void Scheduler::serviceMode() {
  faults_.checkLatched();

  stepper_.deEnergize();
  display_.powerOff();

  const OperatingMode mode = context_.mode();
  log_.event("MODE", modeName(mode));

  switch (mode) {
    case OperatingMode::AUTOMATIC:
      runAutomatic();
      return;
    case OperatingMode::MANUAL:
      runManual();
      return;
    case OperatingMode::CALIBRATION:
      runCalibration();
      return;
    default:
      faults_.fatal(FaultCode::INVALID_MODE);
      return;
  }
}

void Scheduler::runAutomatic() {
  for (;;) {
    if (checkpoint()) {
      return;
    }

    if (presence_.detectPresence() && trackPresence()) {
      return;
    }

    if (!context_.modeSwitchPending()) {
      clock_.delayMs(config_.standby_interval_ms);
    }
  }
}

bool Scheduler::trackPresence() {
  bool present = true;
  while (present) {
    if (checkpoint()) {
      return true;
    }

    display_.showStatus(OperatingMode::AUTOMATIC, "Occupied", "");
    clock_.delayMs(config_.presence_interval_ms);
    present = presence_.detectPresence();

    uint32_t absent_ms = 0;
    while (!present) {
      if (checkpoint()) {
        return true;
      }

      if (absent_ms >= config_.action_after_ms) {
        closeLid();
        return false;
      }

      char line2[20];
      snprintf(line2, sizeof(line2), "close in %lus",
               static_cast<unsigned long>((config_.action_after_ms - absent_ms) / 1000UL));
      display_.showStatus(OperatingMode::AUTOMATIC, "Vacant", line2);

      clock_.delayMs(config_.presence_interval_ms);
      absent_ms += config_.presence_interval_ms;
      present = presence_.detectPresence();
    }
  }
  return false;
}

void Scheduler::runManual() {
  for (;;) {
    if (checkpoint()) {
      return;
    }

    closeLid();
    display_.showStatus(OperatingMode::MANUAL, "MANUAL mode", "");

    if (!context_.modeSwitchPending()) {
      clock_.delayMs(config_.standby_interval_ms);
    }
  }
}

void Scheduler::runCalibration() {
  for (;;) {
    if (checkpoint()) {
      return;
    }

    stepper_.deEnergize();
    showCalibrationReadings();
    if (console_ != nullptr) {
      console_->poll();
    }

    if (!context_.modeSwitchPending()) {
      clock_.delayMs(config_.presence_interval_ms);
    }
  }
}

bool Scheduler::closeLid() {
  ++close_count_;
  last_close_start_ms_ = clock_.millis();
  log_.event(Logger::kInfo, "closing_lid");

  last_actuation_ = stepper_.actuate(config_.close_direction,
                                     config_.lid_revolutions,
                                     stepDelayFor(config_.close_direction));
  display_.powerOff();

  if (last_actuation_.completed) {
    return true;
  }

  // The press that aborted the close may also have latched a fault.
  faults_.checkLatched();
  unwind(config_.close_direction, last_actuation_.steps_executed);
  return false;
}

uint32_t Scheduler::closeCount() const { return close_count_; }

uint32_t Scheduler::lastCloseStartMs() const { return last_close_start_ms_; }

const ActuationResult& Scheduler::lastActuation() const { return last_actuation_; }

bool Scheduler::checkpoint() {
  faults_.checkLatched();
  return context_.takeModeSwitch();
}

void Scheduler::unwind(StepDirection direction, uint32_t steps) {
  if (steps == 0) {
    return;
  }

  ActuationRequest request;
  request.direction = oppositeDirection(direction);
  request.step_count = steps;
  request.step_delay_us = stepDelayFor(request.direction);

  log_.value(Logger::kInfo, "unwind_steps", static_cast<long>(steps));
  const ActuationResult result = stepper_.actuate(request);
  if (!result.completed) {
    // Lid position is unknown from here on.
    log_.value(Logger::kWarn, "unwind_aborted", static_cast<long>(result.steps_executed));
  }
}

uint32_t Scheduler::stepDelayFor(StepDirection direction) const {
  return (direction == config_.close_direction) ? config_.step_sleep_close_us
                                                : config_.step_sleep_open_us;
}

void Scheduler::showCalibrationReadings() {
  char line1[20];
  char line2[20];

  const uint16_t brightness = presence_.light().readBrightness();
  snprintf(line1, sizeof(line1), "L:%u", static_cast<unsigned int>(brightness));

  float distance_cm = 0.0f;
  if (presence_.sonar().measureDistanceCm(distance_cm)) {
    const long tenths = static_cast<long>(distance_cm * 10.0f + 0.5f);
    snprintf(line2, sizeof(line2), "D:%ld.%ldcm", tenths / 10, tenths % 10);
  } else {
    snprintf(line2, sizeof(line2), "D:stall");
  }

  display_.showStatus(OperatingMode::CALIBRATION, line1, line2);
}

}  // namespace lc
