#pragma once

#include <stdint.h>

#include "app/control_context.h"
#include "hal/clock.h"
#include "hal/digital_io.h"

namespace lc {

// Turns button edges into mode advances plus abort/switch requests.
// handleEdge() runs in interrupt context: flag writes only.
class InterruptBridge {
 public:
  InterruptBridge(ControlContext& context,
                  DigitalIo& io,
                  Clock& clock,
                  uint8_t button_pin,
                  uint32_t debounce_ms);

  bool begin();

  void handleEdge();
  static void edgeIsr(void* bridge);

  uint16_t acceptedEdges() const;
  uint16_t rejectedEdges() const;

 private:
  ControlContext& context_;
  DigitalIo& io_;
  Clock& clock_;
  uint8_t button_pin_;
  uint32_t debounce_ms_;

  volatile bool has_edge_;
  volatile uint32_t last_edge_ms_;
  volatile uint16_t accepted_edges_;
  volatile uint16_t rejected_edges_;
};

}  // namespace lc
