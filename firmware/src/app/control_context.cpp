#include "app/control_context.h"

namespace lc {

ControlContext::ControlContext()
    : modes_(OperatingMode::AUTOMATIC),
      mode_switch_requested_(false),
      actuation_abort_requested_(false),
      fault_(FaultCode::NONE),
      retract_steps_(0) {}

ControlContext::ControlContext(OperatingMode initial)
    : modes_(initial),
      mode_switch_requested_(false),
      actuation_abort_requested_(false),
      fault_(FaultCode::NONE),
      retract_steps_(0) {}

OperatingMode ControlContext::mode() const { return modes_.mode(); }

bool ControlContext::advanceMode() { return modes_.advance(); }

void ControlContext::requestModeSwitch() { mode_switch_requested_ = true; }

bool ControlContext::modeSwitchPending() const { return mode_switch_requested_; }

bool ControlContext::takeModeSwitch() {
  if (!mode_switch_requested_) {
    return false;
  }
  mode_switch_requested_ = false;
  return true;
}

void ControlContext::requestActuationAbort() { actuation_abort_requested_ = true; }

bool ControlContext::takeActuationAbort() {
  if (!actuation_abort_requested_) {
    return false;
  }
  actuation_abort_requested_ = false;
  return true;
}

void ControlContext::clearActuationAbort() { actuation_abort_requested_ = false; }

void ControlContext::latchFault(FaultCode code) {
  // Keep the first fault; later ones are usually consequences.
  if (fault_ == FaultCode::NONE) {
    fault_ = code;
  }
}

FaultCode ControlContext::fault() const { return fault_; }

void ControlContext::setRetractSteps(uint32_t steps) { retract_steps_ = steps; }

uint32_t ControlContext::retractSteps() const { return retract_steps_; }

}  // namespace lc
