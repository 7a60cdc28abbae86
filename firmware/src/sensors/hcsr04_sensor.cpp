#include "sensors/hcsr04_sensor.h"

#include "config.h"

namespace lc {

HCSR04Sensor::HCSR04Sensor(DigitalIo& io,
                           Clock& clock,
                           uint8_t trig_pin,
                           uint8_t echo_pin,
                           uint32_t echo_timeout_us)
    : io_(io),
      clock_(clock),
      trig_pin_(trig_pin),
      echo_pin_(echo_pin),
      echo_timeout_us_(echo_timeout_us),
      has_sample_(false),
      timeout_flag_(false),
      last_distance_cm_(0.0f),
      last_pulse_us_(0),
      valid_count_(0),
      timeout_count_(0) {}

void HCSR04Sensor::begin() {
  io_.writeLevel(trig_pin_, false);
  clock_.delayMicroseconds(5);
}

bool HCSR04Sensor::measureDistanceCm(float& distance_cm) {
  fireTrigger();

  uint32_t rise_us = 0;
  if (!waitForEchoLevel(true, clock_.micros(), rise_us)) {
    markTimeout();
    return false;
  }

  uint32_t fall_us = 0;
  if (!waitForEchoLevel(false, rise_us, fall_us)) {
    markTimeout();
    return false;
  }

  last_pulse_us_ = static_cast<uint32_t>(fall_us - rise_us);
  last_distance_cm_ = static_cast<float>(last_pulse_us_) * kSonarCmPerEchoUs;
  has_sample_ = true;
  timeout_flag_ = false;
  if (valid_count_ < 0xFFFFu) {
    ++valid_count_;
  }

  distance_cm = last_distance_cm_;
  return true;
}

bool HCSR04Sensor::hasTimeout() const { return timeout_flag_; }

float HCSR04Sensor::lastDistanceCm() const { return last_distance_cm_; }

void HCSR04Sensor::getDiag(SonarDiag& diag) const {
  diag.has_sample = has_sample_;
  diag.timeout = timeout_flag_;
  diag.raw_cm = last_distance_cm_;
  diag.pulse_us = last_pulse_us_;
  diag.valid_count = valid_count_;
  diag.timeout_count = timeout_count_;
}

void HCSR04Sensor::fireTrigger() {
  io_.writeLevel(trig_pin_, false);
  clock_.delayMicroseconds(kSonarTriggerSettleUs);
  io_.writeLevel(trig_pin_, true);
  clock_.delayMicroseconds(kSonarTriggerPulseUs);
  io_.writeLevel(trig_pin_, false);
}

bool HCSR04Sensor::waitForEchoLevel(bool level, uint32_t start_us, uint32_t& edge_us) {
  while (io_.readLevel(echo_pin_) != level) {
    if (echo_timeout_us_ != 0 &&
        static_cast<uint32_t>(clock_.micros() - start_us) > echo_timeout_us_) {
      return false;
    }
  }
  edge_us = clock_.micros();
  return true;
}

void HCSR04Sensor::markTimeout() {
  timeout_flag_ = true;
  if (timeout_count_ < 0xFFFFu) {
    ++timeout_count_;
  }
}

}  // namespace lc
