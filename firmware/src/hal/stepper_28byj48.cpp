#include "hal/stepper_28byj48.h"

namespace lc {
namespace {

// Wave drive: one coil at a time.
constexpr uint8_t kPhaseTable[Stepper28BYJ48::kPhaseCount][Stepper28BYJ48::kPhaseCount] = {
    {1, 0, 0, 0},
    {0, 1, 0, 0},
    {0, 0, 1, 0},
    {0, 0, 0, 1},
};

const char* directionName(StepDirection direction) {
  switch (direction) {
    case StepDirection::FORWARD:
      return "fwd";
    case StepDirection::REVERSE:
      return "rev";
    default:
      return "bad";
  }
}

}  // namespace

Stepper28BYJ48::Stepper28BYJ48(DigitalIo& io,
                               Clock& clock,
                               ControlContext& context,
                               const uint8_t (&pins)[kPhaseCount],
                               uint32_t steps_per_revolution)
    : io_(io),
      clock_(clock),
      context_(context),
      log_(nullptr),
      pins_(),
      steps_per_revolution_(steps_per_revolution),
      phase_index_(0),
      energized_(false),
      position_steps_(0) {
  for (uint8_t i = 0; i < kPhaseCount; ++i) {
    pins_[i] = pins[i];
  }
}

void Stepper28BYJ48::setLogger(Logger* log) { log_ = log; }

ActuationResult Stepper28BYJ48::actuate(const ActuationRequest& request) {
  ActuationResult result;

  // A press that arrived before this sequence started must not cancel it.
  context_.clearActuationAbort();
  deEnergize();

  int8_t step_sign = 0;
  switch (request.direction) {
    case StepDirection::FORWARD:
      step_sign = 1;
      break;
    case StepDirection::REVERSE:
      step_sign = -1;
      break;
    default:
      context_.latchFault(FaultCode::INVALID_DIRECTION);
      logResult(request, result);
      return result;
  }

  // A latched fault is fatal; the coils stay off until the halt.
  if (context_.fault() != FaultCode::NONE) {
    logResult(request, result);
    return result;
  }

  for (uint32_t i = 0; i < request.step_count; ++i) {
    if (context_.takeActuationAbort()) {
      deEnergize();
      result.completed = false;
      result.steps_executed = i;
      context_.setRetractSteps(i);
      logResult(request, result);
      return result;
    }

    // phase_index_ holds the last energized phase.
    if (step_sign > 0) {
      phase_index_ = static_cast<uint8_t>((phase_index_ + 1) % kPhaseCount);
    } else {
      phase_index_ = static_cast<uint8_t>((phase_index_ + kPhaseCount - 1) % kPhaseCount);
    }
    applyPhase(phase_index_);
    position_steps_ += step_sign;

    clock_.delayMicroseconds(request.step_delay_us);
  }

  deEnergize();
  result.completed = true;
  result.steps_executed = request.step_count;
  context_.setRetractSteps(0);
  logResult(request, result);
  return result;
}

ActuationResult Stepper28BYJ48::actuate(StepDirection direction,
                                        uint16_t revolutions,
                                        uint32_t step_delay_us) {
  ActuationRequest request;
  request.direction = direction;
  request.step_count = static_cast<uint32_t>(revolutions) * steps_per_revolution_;
  request.step_delay_us = step_delay_us;
  return actuate(request);
}

void Stepper28BYJ48::deEnergize() {
  for (uint8_t i = 0; i < kPhaseCount; ++i) {
    io_.writeLevel(pins_[i], false);
  }
  energized_ = false;
}

bool Stepper28BYJ48::isEnergized() const { return energized_; }

int32_t Stepper28BYJ48::positionSteps() const { return position_steps_; }

void Stepper28BYJ48::resetPositionSteps(int32_t steps) { position_steps_ = steps; }

uint32_t Stepper28BYJ48::stepsPerRevolution() const { return steps_per_revolution_; }

void Stepper28BYJ48::applyPhase(uint8_t phase) {
  for (uint8_t i = 0; i < kPhaseCount; ++i) {
    io_.writeLevel(pins_[i], kPhaseTable[phase][i] != 0);
  }
  energized_ = true;
}

void Stepper28BYJ48::logResult(const ActuationRequest& request, const ActuationResult& result) {
  if (log_ == nullptr) {
    return;
  }
  log_->begin("ACT");
  log_->field(directionName(request.direction));
  log_->field(static_cast<long>(request.step_count));
  log_->field(static_cast<long>(result.steps_executed));
  log_->field(result.completed ? "done" : "aborted");
  log_->end();
}

}  // namespace lc
