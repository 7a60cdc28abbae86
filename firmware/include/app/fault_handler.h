#pragma once

#include "app/control_context.h"
#include "display/status_display.h"
#include "hal/stepper_28byj48.h"
#include "log.h"
#include "types.h"

namespace lc {

// Platform stop. Must not return on target.
typedef void (*HaltFn)();

// The one path every fatal condition takes: coils off, report, halt.
class FaultHandler {
 public:
  FaultHandler(Stepper28BYJ48& stepper,
               StatusDisplay& display,
               ControlContext& context,
               Logger& log,
               HaltFn halt);

  void fatal(FaultCode code);

  // Routes a fault latched by the interrupt or the actuator, if any.
  void checkLatched();

 private:
  Stepper28BYJ48& stepper_;
  StatusDisplay& display_;
  ControlContext& context_;
  Logger& log_;
  HaltFn halt_;
};

}  // namespace lc
