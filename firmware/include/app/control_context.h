#pragma once

#include <stdint.h>

#include "app/state_machine.h"
#include "types.h"

namespace lc {

// State shared between the button interrupt and the main control flow.
//
// Every field the interrupt writes is a single byte, so reads and writes
// cannot tear on the target. The main flow only looks at these at
// checkpoints: loop tops and between actuator steps.
class ControlContext {
 public:
  ControlContext();
  explicit ControlContext(OperatingMode initial);

  OperatingMode mode() const;
  bool advanceMode();

  void requestModeSwitch();
  bool modeSwitchPending() const;
  // Read-and-clear. At most one pending switch is ever reported.
  bool takeModeSwitch();

  void requestActuationAbort();
  bool takeActuationAbort();
  void clearActuationAbort();

  void latchFault(FaultCode code);
  FaultCode fault() const;

  void setRetractSteps(uint32_t steps);
  uint32_t retractSteps() const;

 private:
  ModeStateMachine modes_;
  volatile bool mode_switch_requested_;
  volatile bool actuation_abort_requested_;
  volatile FaultCode fault_;
  uint32_t retract_steps_;
};

}  // namespace lc
