#pragma once

#include <stdint.h>

namespace lc {

// KY-040 push button, INT0.
constexpr uint8_t PIN_BUTTON = 2;

// ULN2003 inputs IN1..IN4.
constexpr uint8_t PIN_MOTOR_1 = 4;
constexpr uint8_t PIN_MOTOR_2 = 5;
constexpr uint8_t PIN_MOTOR_3 = 6;
constexpr uint8_t PIN_MOTOR_4 = 7;

constexpr uint8_t PIN_TRIG = 8;
constexpr uint8_t PIN_ECHO = 9;

// SFH 300 phototransistor (A0 on the Uno).
constexpr uint8_t PIN_LIGHT = 14;

constexpr uint8_t OLED_I2C_ADDR = 0x3C;
constexpr uint8_t OLED_WIDTH = 128;
constexpr uint8_t OLED_HEIGHT = 64;

}  // namespace lc
