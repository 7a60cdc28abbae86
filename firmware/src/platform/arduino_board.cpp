#include "platform/arduino_board.h"

#include <string.h>

#include <util/atomic.h>

#include "calibration.h"

namespace lc {
namespace {

// One slot per external interrupt line (INT0, INT1 on the Uno).
constexpr int kEdgeSlots = 2;

volatile EdgeHandler g_edge_handlers[kEdgeSlots] = {nullptr, nullptr};
void* volatile g_edge_contexts[kEdgeSlots] = {nullptr, nullptr};

void dispatchEdge(int slot) {
  const EdgeHandler handler = g_edge_handlers[slot];
  if (handler != nullptr) {
    handler(g_edge_contexts[slot]);
  }
}

void edgeSlot0Isr() { dispatchEdge(0); }

void edgeSlot1Isr() { dispatchEdge(1); }

int arduinoEdgeMode(EdgeType edge) {
  switch (edge) {
    case EdgeType::FALLING_EDGE:
      return FALLING;
    case EdgeType::ANY_EDGE:
      return CHANGE;
    case EdgeType::RISING_EDGE:
    default:
      return RISING;
  }
}

}  // namespace

ArduinoBoard::ArduinoBoard() {}

void ArduinoBoard::configureOutput(uint8_t pin) {
  pinMode(pin, OUTPUT);
  digitalWrite(pin, LOW);
}

void ArduinoBoard::configureInput(uint8_t pin) { pinMode(pin, INPUT); }

bool ArduinoBoard::readLevel(uint8_t pin) { return digitalRead(pin) == HIGH; }

void ArduinoBoard::writeLevel(uint8_t pin, bool high) { digitalWrite(pin, high ? HIGH : LOW); }

uint16_t ArduinoBoard::readAnalog(uint8_t pin) {
  const uint16_t raw = static_cast<uint16_t>(analogRead(pin));
  return scaleAdcTo16Bit(raw, LIGHT_ADC_BITS);
}

bool ArduinoBoard::registerEdgeInterrupt(uint8_t pin,
                                         EdgeType edge,
                                         EdgeHandler handler,
                                         void* context) {
  const int irq = digitalPinToInterrupt(pin);
  if (handler == nullptr || irq == NOT_AN_INTERRUPT || irq < 0 || irq >= kEdgeSlots) {
    return false;
  }

  ATOMIC_BLOCK(ATOMIC_RESTORESTATE) {
    g_edge_handlers[irq] = handler;
    g_edge_contexts[irq] = context;
  }

  attachInterrupt(irq, (irq == 0) ? edgeSlot0Isr : edgeSlot1Isr, arduinoEdgeMode(edge));
  return true;
}

uint32_t ArduinoBoard::millis() { return ::millis(); }

uint32_t ArduinoBoard::micros() { return ::micros(); }

void ArduinoBoard::delayMs(uint32_t ms) { ::delay(ms); }

void ArduinoBoard::delayMicroseconds(uint32_t us) {
  // The core's delayMicroseconds() takes an unsigned int (16 bits on AVR).
  while (us > 10000UL) {
    ::delayMicroseconds(10000U);
    us -= 10000UL;
  }
  ::delayMicroseconds(static_cast<unsigned int>(us));
}

void SerialLogSink::write(const char* text) { Serial.print(text); }

void SerialLogSink::write(char c) { Serial.print(c); }

void SerialLogSink::write(long value) { Serial.print(value); }

void SerialLogSink::write(float value, uint8_t digits) { Serial.print(value, digits); }

void SerialLogSink::endLine() { Serial.println(); }

SerialLineReader::SerialLineReader() : cmd_buffer_(), cmd_len_(0) {}

bool SerialLineReader::readLine(char* buffer, size_t capacity) {
  if (buffer == nullptr || capacity == 0) {
    return false;
  }

  while (Serial.available() > 0) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      cmd_buffer_[cmd_len_] = '\0';
      strncpy(buffer, cmd_buffer_, capacity - 1);
      buffer[capacity - 1] = '\0';
      cmd_len_ = 0;
      return true;
    }
    if (cmd_len_ + 1 < sizeof(cmd_buffer_)) {
      cmd_buffer_[cmd_len_++] = c;
    }
  }
  return false;
}

}  // namespace lc
