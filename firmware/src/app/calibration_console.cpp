#include "app/calibration_console.h"

#include <stdlib.h>
#include <string.h>

#include "app/state_machine.h"

namespace lc {
namespace {

// One jog never exceeds four revolutions.
constexpr long kMaxJogRevolutions = 4;

}  // namespace

CalibrationConsole::CalibrationConsole(LineReader& input,
                                       Stepper28BYJ48& stepper,
                                       PresenceDetector& presence,
                                       ControlContext& context,
                                       Logger& log,
                                       uint32_t jog_step_delay_us)
    : input_(input),
      stepper_(stepper),
      presence_(presence),
      context_(context),
      log_(log),
      jog_step_delay_us_(jog_step_delay_us),
      line_(),
      last_jog_() {}

bool CalibrationConsole::poll() {
  if (!input_.readLine(line_, sizeof(line_))) {
    return false;
  }
  handleCommand(line_);
  return true;
}

void CalibrationConsole::handleCommand(char* line) {
  char* saveptr = nullptr;
  char* token = strtok_r(line, " ", &saveptr);
  if (token == nullptr) {
    return;
  }

  if (strcmp(token, "help") == 0) {
    printHelp();
    return;
  }

  if (strcmp(token, "status") == 0) {
    printStatus();
    return;
  }

  if (strcmp(token, "release") == 0) {
    stepper_.deEnergize();
    log_.event(Logger::kOk, "released");
    return;
  }

  if (strcmp(token, "jog") == 0) {
    handleJog(strtok_r(nullptr, " ", &saveptr));
    return;
  }

  log_.event(Logger::kError, "unknown_command");
}

const ActuationResult& CalibrationConsole::lastJog() const { return last_jog_; }

void CalibrationConsole::printHelp() {
  log_.event(Logger::kInfo, "commands:help|status|release|jog <signed_steps>");
}

void CalibrationConsole::printStatus() {
  const PresenceSample& sample = presence_.lastSample();

  log_.text("STATE", "mode", modeName(context_.mode()));
  log_.value("MOTOR", "position_steps", static_cast<long>(stepper_.positionSteps()));
  log_.value("MOTOR", "retract_steps", static_cast<long>(context_.retractSteps()));
  log_.value("SENSORS", "brightness", static_cast<long>(sample.brightness));
  log_.value("SENSORS", "baseline_cm", presence_.baselineCm(), 2);
  log_.value("SENSORS", "stalls", static_cast<long>(presence_.stallCount()));
}

void CalibrationConsole::handleJog(char* steps_arg) {
  if (steps_arg == nullptr) {
    log_.event(Logger::kError, "usage:jog <signed_steps>");
    return;
  }

  const long steps = atol(steps_arg);
  const long max_steps = kMaxJogRevolutions * static_cast<long>(stepper_.stepsPerRevolution());
  if (steps == 0 || steps > max_steps || steps < -max_steps) {
    log_.event(Logger::kError, "invalid_jog_args");
    return;
  }

  ActuationRequest request;
  request.direction = (steps > 0) ? StepDirection::FORWARD : StepDirection::REVERSE;
  request.step_count = static_cast<uint32_t>(labs(steps));
  request.step_delay_us = jog_step_delay_us_;

  last_jog_ = stepper_.actuate(request);
  if (last_jog_.completed) {
    log_.value(Logger::kOk, "jog_done", static_cast<long>(last_jog_.steps_executed));
  } else {
    log_.value(Logger::kWarn, "jog_aborted", static_cast<long>(last_jog_.steps_executed));
  }
}

}  // namespace lc
