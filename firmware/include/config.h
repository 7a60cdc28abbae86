#pragma once

#include <stdint.h>

namespace lc {

// Presence detection.
#ifndef ACTION_AFTER_SECONDS
#define ACTION_AFTER_SECONDS 60
#endif
#ifndef BRIGHTNESS_THRESHOLD
#define BRIGHTNESS_THRESHOLD 25000
#endif
#ifndef MOTION_THRESHOLD_CM
#define MOTION_THRESHOLD_CM 5.0f
#endif
// Typical distance measured when nobody is in the room.
#ifndef INITIAL_DISTANCE_CM
#define INITIAL_DISTANCE_CM 165.0f
#endif

// Poll cadence.
#ifndef POLLING_INTERVAL_PRESENCE_MS
#define POLLING_INTERVAL_PRESENCE_MS 1000UL
#endif
#ifndef POLLING_INTERVAL_STANDBY_MS
#define POLLING_INTERVAL_STANDBY_MS 5000UL
#endif

// 28BYJ-48 stepper (ULN2003 driver).
#ifndef STEPPER_STEPS_PER_REV
#define STEPPER_STEPS_PER_REV 2048
#endif
#ifndef STEP_SLEEP_OPEN_US
#define STEP_SLEEP_OPEN_US 2000UL
#endif
#ifndef STEP_SLEEP_CLOSE_US
#define STEP_SLEEP_CLOSE_US 3000UL
#endif
#ifndef LID_REVOLUTIONS
#define LID_REVOLUTIONS 1
#endif

// HC-SR04. A timeout of 0 waits on the echo line without a bound.
#ifndef SONAR_ECHO_TIMEOUT_US
#define SONAR_ECHO_TIMEOUT_US 30000UL
#endif

#ifndef BUTTON_DEBOUNCE_MS
#define BUTTON_DEBOUNCE_MS 50UL
#endif

#ifndef SERIAL_BAUD
#define SERIAL_BAUD 115200
#endif

constexpr uint32_t kActionAfterMs = static_cast<uint32_t>(ACTION_AFTER_SECONDS) * 1000UL;
constexpr uint16_t kBrightnessThreshold = BRIGHTNESS_THRESHOLD;
constexpr float kMotionThresholdCm = MOTION_THRESHOLD_CM;
constexpr float kInitialDistanceCm = INITIAL_DISTANCE_CM;

constexpr uint32_t kPollingIntervalPresenceMs = POLLING_INTERVAL_PRESENCE_MS;
constexpr uint32_t kPollingIntervalStandbyMs = POLLING_INTERVAL_STANDBY_MS;

constexpr uint32_t kStepsPerRevolution = STEPPER_STEPS_PER_REV;
constexpr uint32_t kStepSleepOpenUs = STEP_SLEEP_OPEN_US;
constexpr uint32_t kStepSleepCloseUs = STEP_SLEEP_CLOSE_US;
constexpr uint16_t kLidRevolutions = LID_REVOLUTIONS;

constexpr uint32_t kSonarEchoTimeoutUs = SONAR_ECHO_TIMEOUT_US;
constexpr uint32_t kSonarTriggerSettleUs = 2;
constexpr uint32_t kSonarTriggerPulseUs = 10;
// (0.0343 cm per us) / 2
constexpr float kSonarCmPerEchoUs = 0.01715f;

constexpr uint32_t kButtonDebounceMs = BUTTON_DEBOUNCE_MS;

static_assert(ACTION_AFTER_SECONDS > 0, "ACTION_AFTER_SECONDS must be positive");
static_assert(POLLING_INTERVAL_PRESENCE_MS > 0, "POLLING_INTERVAL_PRESENCE_MS must be positive");
static_assert(LID_REVOLUTIONS > 0, "LID_REVOLUTIONS must be positive");

}  // namespace lc
