#include "log.h"

namespace lc {

const char* const Logger::kInfo = "INFO";
const char* const Logger::kWarn = "WARN";
const char* const Logger::kError = "ERR";
const char* const Logger::kOk = "OK";

Logger::Logger(LogSink* sink) : sink_(sink) {}

void Logger::setSink(LogSink* sink) { sink_ = sink; }

void Logger::event(const char* tag, const char* name) {
  if (sink_ == nullptr) {
    return;
  }
  sink_->write(tag);
  sink_->write(',');
  sink_->write(name);
  sink_->endLine();
}

void Logger::value(const char* tag, const char* key, long value) {
  if (sink_ == nullptr) {
    return;
  }
  sink_->write(tag);
  sink_->write(',');
  sink_->write(key);
  sink_->write('=');
  sink_->write(value);
  sink_->endLine();
}

void Logger::value(const char* tag, const char* key, float value, uint8_t digits) {
  if (sink_ == nullptr) {
    return;
  }
  sink_->write(tag);
  sink_->write(',');
  sink_->write(key);
  sink_->write('=');
  sink_->write(value, digits);
  sink_->endLine();
}

void Logger::text(const char* tag, const char* key, const char* text) {
  if (sink_ == nullptr) {
    return;
  }
  sink_->write(tag);
  sink_->write(',');
  sink_->write(key);
  sink_->write('=');
  sink_->write(text);
  sink_->endLine();
}

void Logger::begin(const char* tag) {
  if (sink_ != nullptr) {
    sink_->write(tag);
  }
}

void Logger::field(const char* text) {
  if (sink_ != nullptr) {
    sink_->write(',');
    sink_->write(text);
  }
}

void Logger::field(long value) {
  if (sink_ != nullptr) {
    sink_->write(',');
    sink_->write(value);
  }
}

void Logger::field(float value, uint8_t digits) {
  if (sink_ != nullptr) {
    sink_->write(',');
    sink_->write(value, digits);
  }
}

void Logger::end() {
  if (sink_ != nullptr) {
    sink_->endLine();
  }
}

}  // namespace lc
