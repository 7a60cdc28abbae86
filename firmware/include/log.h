#pragma once

#include <stdint.h>

namespace lc {

// Byte sink for console lines. The firmware sink forwards to Serial.
class LogSink {
 public:
  virtual ~LogSink() {}

  virtual void write(const char* text) = 0;
  virtual void write(char c) = 0;
  virtual void write(long value) = 0;
  virtual void write(float value, uint8_t digits) = 0;
  virtual void endLine() = 0;
};

// Console lines are "TAG,payload". A null sink drops everything.
class Logger {
 public:
  static const char* const kInfo;
  static const char* const kWarn;
  static const char* const kError;
  static const char* const kOk;

  explicit Logger(LogSink* sink = nullptr);

  void setSink(LogSink* sink);

  // TAG,event
  void event(const char* tag, const char* name);
  // TAG,key=value
  void value(const char* tag, const char* key, long value);
  void value(const char* tag, const char* key, float value, uint8_t digits);
  // TAG,key=text
  void text(const char* tag, const char* key, const char* text);

  // Field-by-field record: begin(tag), field(...)..., end().
  void begin(const char* tag);
  void field(const char* text);
  void field(long value);
  void field(float value, uint8_t digits);
  void end();

 private:
  LogSink* sink_;
};

}  // namespace lc
