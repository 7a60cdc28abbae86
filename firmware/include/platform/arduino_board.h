#pragma once

#include <Arduino.h>

#include <stddef.h>

#include "app/calibration_console.h"
#include "hal/clock.h"
#include "hal/digital_io.h"
#include "log.h"

namespace lc {

// Arduino core behind the DigitalIo and Clock interfaces.
class ArduinoBoard : public DigitalIo, public Clock {
 public:
  ArduinoBoard();

  void configureOutput(uint8_t pin);
  void configureInput(uint8_t pin);

  bool readLevel(uint8_t pin) override;
  void writeLevel(uint8_t pin, bool high) override;
  uint16_t readAnalog(uint8_t pin) override;
  bool registerEdgeInterrupt(uint8_t pin,
                             EdgeType edge,
                             EdgeHandler handler,
                             void* context) override;

  uint32_t millis() override;
  uint32_t micros() override;
  void delayMs(uint32_t ms) override;
  void delayMicroseconds(uint32_t us) override;
};

class SerialLogSink : public LogSink {
 public:
  void write(const char* text) override;
  void write(char c) override;
  void write(long value) override;
  void write(float value, uint8_t digits) override;
  void endLine() override;
};

class SerialLineReader : public LineReader {
 public:
  SerialLineReader();

  bool readLine(char* buffer, size_t capacity) override;

 private:
  char cmd_buffer_[64];
  size_t cmd_len_;
};

}  // namespace lc
