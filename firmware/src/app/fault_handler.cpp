#include "app/fault_handler.h"

namespace lc {

FaultHandler::FaultHandler(Stepper28BYJ48& stepper,
                           StatusDisplay& display,
                           ControlContext& context,
                           Logger& log,
                           HaltFn halt)
    : stepper_(stepper), display_(display), context_(context), log_(log), halt_(halt) {}

void FaultHandler::fatal(FaultCode code) {
  stepper_.deEnergize();
  context_.latchFault(code);

  display_.showStatus(context_.mode(), "FAULT", faultName(code));
  log_.event(Logger::kError, faultName(code));

  if (halt_ != nullptr) {
    halt_();
  }
  for (;;) {
    stepper_.deEnergize();
  }
}

void FaultHandler::checkLatched() {
  const FaultCode code = context_.fault();
  if (code != FaultCode::NONE) {
    fatal(code);
  }
}

}  // namespace lc
