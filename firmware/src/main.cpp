#include <Arduino.h>
#include <Wire.h>

#include "app/calibration_console.h"
#include "app/control_context.h"
#include "app/fault_handler.h"
#include "app/interrupt_bridge.h"
#include "app/scheduler.h"
#include "config.h"
#include "hal/stepper_28byj48.h"
#include "log.h"
#include "pins.h"
#include "platform/arduino_board.h"
#include "platform/oled_display.h"
#include "sensors/hcsr04_sensor.h"
#include "sensors/light_sensor.h"
#include "sensors/presence_detector.h"

namespace {

using namespace lc;

const uint8_t kMotorPins[Stepper28BYJ48::kPhaseCount] = {
    PIN_MOTOR_1, PIN_MOTOR_2, PIN_MOTOR_3, PIN_MOTOR_4};

ArduinoBoard g_board;
SerialLogSink g_log_sink;
Logger g_log(&g_log_sink);
OledStatusDisplay g_display(Wire, OLED_I2C_ADDR, OLED_WIDTH, OLED_HEIGHT);

ControlContext g_context;

Stepper28BYJ48 g_stepper(g_board, g_board, g_context, kMotorPins, kStepsPerRevolution);
LightSensor g_light(g_board, PIN_LIGHT);
HCSR04Sensor g_sonar(g_board, g_board, PIN_TRIG, PIN_ECHO, kSonarEchoTimeoutUs);
PresenceDetector g_presence(g_light, g_sonar, g_board, PresenceConfig());

void haltForever() {
  noInterrupts();
  for (;;) {
    delayMicroseconds(1000);
  }
}

FaultHandler g_faults(g_stepper, g_display, g_context, g_log, &haltForever);

SerialLineReader g_console_input;
CalibrationConsole g_console(g_console_input, g_stepper, g_presence, g_context, g_log, kStepSleepOpenUs);

Scheduler g_scheduler(g_context,
                      g_presence,
                      g_stepper,
                      g_display,
                      g_board,
                      g_faults,
                      g_log,
                      SchedulerConfig());

InterruptBridge g_bridge(g_context, g_board, g_board, PIN_BUTTON, kButtonDebounceMs);

}  // namespace

void setup() {
  Serial.begin(SERIAL_BAUD);
  delay(250);

  g_log.event("BOOT", "lid_closer");

  for (uint8_t i = 0; i < Stepper28BYJ48::kPhaseCount; ++i) {
    g_board.configureOutput(kMotorPins[i]);
  }
  g_board.configureOutput(PIN_TRIG);
  g_board.configureInput(PIN_ECHO);
  g_board.configureInput(PIN_BUTTON);

  g_stepper.setLogger(&g_log);
  g_stepper.deEnergize();

  g_presence.setLogger(&g_log);
  g_sonar.begin();

  Wire.begin();
  if (!g_display.begin()) {
    g_log.event(Logger::kWarn, "display_not_found");
  }

  g_scheduler.setConsole(&g_console);

  if (!g_bridge.begin()) {
    g_log.event(Logger::kError, "button_irq_unavailable");
  }
}

void loop() { g_scheduler.serviceMode(); }
