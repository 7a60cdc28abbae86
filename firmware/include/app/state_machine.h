#pragma once

#include "types.h"

namespace lc {

// AUTOMATIC -> MANUAL -> CALIBRATION -> AUTOMATIC. Returns false for a
// value outside the cycle; `next` is left untouched in that case.
bool nextMode(OperatingMode current, OperatingMode& next);

const char* modeName(OperatingMode mode);

class ModeStateMachine {
 public:
  ModeStateMachine();
  explicit ModeStateMachine(OperatingMode initial);

  OperatingMode mode() const;
  void reset();

  // Safe to call from interrupt context.
  bool advance();

 private:
  volatile OperatingMode mode_;
};

}  // namespace lc
