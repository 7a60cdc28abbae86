#pragma once

#include <stdint.h>

#include "hal/clock.h"
#include "hal/digital_io.h"

namespace lc {

struct SonarDiag {
  bool has_sample = false;
  bool timeout = false;
  float raw_cm = 0.0f;
  uint32_t pulse_us = 0;
  uint16_t valid_count = 0;
  uint16_t timeout_count = 0;
};

// Blocking HC-SR04 reader. The echo wait busy-loops the caller and is
// not an interrupt checkpoint.
class HCSR04Sensor {
 public:
  // echo_timeout_us == 0 waits on the echo line forever.
  HCSR04Sensor(DigitalIo& io,
               Clock& clock,
               uint8_t trig_pin,
               uint8_t echo_pin,
               uint32_t echo_timeout_us);

  void begin();

  // Returns false if either echo edge missed its deadline (sensor stall).
  bool measureDistanceCm(float& distance_cm);

  bool hasTimeout() const;
  float lastDistanceCm() const;
  void getDiag(SonarDiag& diag) const;

 private:
  DigitalIo& io_;
  Clock& clock_;
  uint8_t trig_pin_;
  uint8_t echo_pin_;
  uint32_t echo_timeout_us_;

  bool has_sample_;
  bool timeout_flag_;
  float last_distance_cm_;
  uint32_t last_pulse_us_;
  uint16_t valid_count_;
  uint16_t timeout_count_;

  void fireTrigger();
  bool waitForEchoLevel(bool level, uint32_t start_us, uint32_t& edge_us);
  void markTimeout();
};

}  // namespace lc
