#include "app/interrupt_bridge.h"

namespace lc {

InterruptBridge::InterruptBridge(ControlContext& context,
                                 DigitalIo& io,
                                 Clock& clock,
                                 uint8_t button_pin,
                                 uint32_t debounce_ms)
    : context_(context),
      io_(io),
      clock_(clock),
      button_pin_(button_pin),
      debounce_ms_(debounce_ms),
      has_edge_(false),
      last_edge_ms_(0),
      accepted_edges_(0),
      rejected_edges_(0) {}

bool InterruptBridge::begin() {
  return io_.registerEdgeInterrupt(button_pin_, EdgeType::RISING_EDGE, &InterruptBridge::edgeIsr, this);
}

void InterruptBridge::handleEdge() {
  const uint32_t now_ms = clock_.millis();

  // Contact bounce: ignore edges too close to the last accepted one.
  if (has_edge_ && static_cast<uint32_t>(now_ms - last_edge_ms_) < debounce_ms_) {
    if (rejected_edges_ < 0xFFFFu) {
      ++rejected_edges_;
    }
    return;
  }
  has_edge_ = true;
  last_edge_ms_ = now_ms;
  if (accepted_edges_ < 0xFFFFu) {
    ++accepted_edges_;
  }

  context_.requestActuationAbort();
  if (!context_.advanceMode()) {
    // Reported from the main flow; the display and log are not ISR safe.
    context_.latchFault(FaultCode::INVALID_MODE);
  }
  context_.requestModeSwitch();
}

void InterruptBridge::edgeIsr(void* bridge) {
  if (bridge == nullptr) {
    return;
  }
  static_cast<InterruptBridge*>(bridge)->handleEdge();
}

uint16_t InterruptBridge::acceptedEdges() const { return accepted_edges_; }

uint16_t InterruptBridge::rejectedEdges() const { return rejected_edges_; }

}  // namespace lc
