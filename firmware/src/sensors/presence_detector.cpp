#include "sensors/presence_detector.h"

namespace lc {

PresenceDetector::PresenceDetector(LightSensor& light,
                                   HCSR04Sensor& sonar,
                                   Clock& clock,
                                   const PresenceConfig& config)
    : light_(light),
      sonar_(sonar),
      clock_(clock),
      log_(nullptr),
      config_(config),
      baseline_cm_(config.initial_baseline_cm),
      last_sample_(),
      stall_count_(0) {}

void PresenceDetector::setLogger(Logger* log) { log_ = log; }

bool PresenceDetector::detectPresence() {
  PresenceSample sample;
  sample.ts_ms = clock_.millis();

  sample.brightness = light_.readBrightness();
  sample.bright = sample.brightness > config_.brightness_threshold;

  float distance_cm = 0.0f;
  sample.distance_valid = sonar_.measureDistanceCm(distance_cm);
  if (sample.distance_valid) {
    sample.distance_cm = distance_cm;
    sample.motion = (distance_cm > baseline_cm_ + config_.motion_threshold_cm) ||
                    (distance_cm < baseline_cm_ - config_.motion_threshold_cm);
    baseline_cm_ = distance_cm;
  } else {
    // Stall: no motion information this round, baseline kept.
    sample.distance_cm = baseline_cm_;
    if (stall_count_ < 0xFFFFu) {
      ++stall_count_;
    }
    if (log_ != nullptr) {
      log_->event(Logger::kWarn, "sonar_stall");
    }
  }

  sample.present = sample.bright || sample.motion;
  last_sample_ = sample;

  if (log_ != nullptr) {
    log_->begin("PRES");
    log_->field(static_cast<long>(sample.ts_ms));
    log_->field(static_cast<long>(sample.brightness));
    log_->field(sample.distance_cm, 2);
    log_->field(sample.present ? 1L : 0L);
    log_->end();
  }

  return sample.present;
}

float PresenceDetector::baselineCm() const { return baseline_cm_; }

const PresenceSample& PresenceDetector::lastSample() const { return last_sample_; }

uint16_t PresenceDetector::stallCount() const { return stall_count_; }

LightSensor& PresenceDetector::light() { return light_; }

HCSR04Sensor& PresenceDetector::sonar() { return sonar_; }

}  // namespace lc
