#pragma once

#include "app/calibration_console.h"
#include "app/control_context.h"
#include "app/fault_handler.h"
#include "app/interrupt_bridge.h"
#include "app/scheduler.h"
#include "config.h"
#include "hal/stepper_28byj48.h"
#include "log.h"
#include "pins.h"
#include "sensors/hcsr04_sensor.h"
#include "sensors/light_sensor.h"
#include "sensors/presence_detector.h"
#include "support/fake_board.h"

namespace lc {
namespace test {

const uint8_t kRigMotorPins[Stepper28BYJ48::kPhaseCount] = {
    PIN_MOTOR_1, PIN_MOTOR_2, PIN_MOTOR_3, PIN_MOTOR_4};

// The firmware object graph from main.cpp, wired to the simulated board.
struct DeviceRig {
  explicit DeviceRig(OperatingMode initial = OperatingMode::AUTOMATIC,
                     const SchedulerConfig& config = SchedulerConfig())
      : board(PIN_TRIG, PIN_ECHO, PIN_LIGHT),
        log(&sink),
        context(initial),
        stepper(board, board, context, kRigMotorPins, kStepsPerRevolution),
        light(board, PIN_LIGHT),
        sonar(board, board, PIN_TRIG, PIN_ECHO, kSonarEchoTimeoutUs),
        presence(light, sonar, board, PresenceConfig()),
        faults(stepper, display, context, log, &throwingHalt),
        console(input, stepper, presence, context, log, kStepSleepOpenUs),
        scheduler(context, presence, stepper, display, board, faults, log, config),
        bridge(context, board, board, PIN_BUTTON, kButtonDebounceMs) {
    stepper.setLogger(&log);
    presence.setLogger(&log);
    sonar.begin();
    scheduler.setConsole(&console);
    bridge.begin();
  }

  bool anyCoilHigh() const {
    for (uint8_t i = 0; i < Stepper28BYJ48::kPhaseCount; ++i) {
      if (board.level(kRigMotorPins[i])) {
        return true;
      }
    }
    return false;
  }

  FakeBoard board;
  CaptureLogSink sink;
  Logger log;
  RecordingDisplay display;
  QueueLineReader input;

  ControlContext context;
  Stepper28BYJ48 stepper;
  LightSensor light;
  HCSR04Sensor sonar;
  PresenceDetector presence;
  FaultHandler faults;
  CalibrationConsole console;
  Scheduler scheduler;
  InterruptBridge bridge;
};

}  // namespace test
}  // namespace lc
