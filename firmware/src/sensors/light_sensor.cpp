#include "sensors/light_sensor.h"

namespace lc {

LightSensor::LightSensor(DigitalIo& io, uint8_t pin) : io_(io), pin_(pin), last_brightness_(0) {}

uint16_t LightSensor::readBrightness() {
  last_brightness_ = io_.readAnalog(pin_);
  return last_brightness_;
}

uint16_t LightSensor::lastBrightness() const { return last_brightness_; }

}  // namespace lc
