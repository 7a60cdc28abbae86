#pragma once

#include <stdint.h>

#include "config.h"
#include "hal/clock.h"
#include "log.h"
#include "sensors/hcsr04_sensor.h"
#include "sensors/light_sensor.h"
#include "types.h"

namespace lc {

struct PresenceConfig {
  uint16_t brightness_threshold = kBrightnessThreshold;
  float motion_threshold_cm = kMotionThresholdCm;
  float initial_baseline_cm = kInitialDistanceCm;
};

// Fuses the light level and the change in sonar distance into a single
// occupied/empty verdict.
//
// The baseline is replaced by every successful distance reading, so an
// approach slower than the motion threshold per poll never counts as
// motion.
class PresenceDetector {
 public:
  PresenceDetector(LightSensor& light,
                   HCSR04Sensor& sonar,
                   Clock& clock,
                   const PresenceConfig& config);

  void setLogger(Logger* log);

  bool detectPresence();

  float baselineCm() const;
  const PresenceSample& lastSample() const;
  uint16_t stallCount() const;

  // Raw readings for status output. The baseline is left alone.
  LightSensor& light();
  HCSR04Sensor& sonar();

 private:
  LightSensor& light_;
  HCSR04Sensor& sonar_;
  Clock& clock_;
  Logger* log_;
  PresenceConfig config_;

  float baseline_cm_;
  PresenceSample last_sample_;
  uint16_t stall_count_;
};

}  // namespace lc
