#pragma once

#include <stdint.h>

namespace lc {

enum class EdgeType : uint8_t {
  RISING_EDGE = 0,
  FALLING_EDGE,
  ANY_EDGE
};

// Called from interrupt context. Must not block.
typedef void (*EdgeHandler)(void* context);

class DigitalIo {
 public:
  virtual ~DigitalIo() {}

  virtual bool readLevel(uint8_t pin) = 0;
  virtual void writeLevel(uint8_t pin, bool high) = 0;
  // Full 16-bit scale regardless of the converter width.
  virtual uint16_t readAnalog(uint8_t pin) = 0;

  virtual bool registerEdgeInterrupt(uint8_t pin,
                                     EdgeType edge,
                                     EdgeHandler handler,
                                     void* context) = 0;
};

}  // namespace lc
