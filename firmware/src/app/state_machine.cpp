#include "app/state_machine.h"

namespace lc {

bool nextMode(OperatingMode current, OperatingMode& next) {
  switch (current) {
    case OperatingMode::AUTOMATIC:
      next = OperatingMode::MANUAL;
      return true;
    case OperatingMode::MANUAL:
      next = OperatingMode::CALIBRATION;
      return true;
    case OperatingMode::CALIBRATION:
      next = OperatingMode::AUTOMATIC;
      return true;
    default:
      return false;
  }
}

const char* modeName(OperatingMode mode) {
  switch (mode) {
    case OperatingMode::AUTOMATIC:
      return "AUTOMATIC";
    case OperatingMode::MANUAL:
      return "MANUAL";
    case OperatingMode::CALIBRATION:
      return "CALIBRATION";
    default:
      return "UNKNOWN";
  }
}

ModeStateMachine::ModeStateMachine() : mode_(OperatingMode::AUTOMATIC) {}

ModeStateMachine::ModeStateMachine(OperatingMode initial) : mode_(initial) {}

OperatingMode ModeStateMachine::mode() const { return mode_; }

void ModeStateMachine::reset() { mode_ = OperatingMode::AUTOMATIC; }

bool ModeStateMachine::advance() {
  OperatingMode next = mode_;
  if (!nextMode(mode_, next)) {
    return false;
  }
  mode_ = next;
  return true;
}

}  // namespace lc
