#include <gtest/gtest.h>

#include "app/control_context.h"
#include "app/interrupt_bridge.h"
#include "config.h"
#include "pins.h"
#include "support/fake_board.h"

namespace lc {
namespace {

using test::FakeBoard;

class InterruptBridgeTest : public ::testing::Test {
 protected:
  InterruptBridgeTest()
      : board_(PIN_TRIG, PIN_ECHO, PIN_LIGHT),
        bridge_(context_, board_, board_, PIN_BUTTON, kButtonDebounceMs) {}

  // Fires one edge, then lets the contacts settle.
  void press() {
    board_.fireEdge();
    board_.delayMs(kButtonDebounceMs + 10);
  }

  FakeBoard board_;
  ControlContext context_;
  InterruptBridge bridge_;
};

TEST_F(InterruptBridgeTest, RegistersRisingEdgeOnButtonPin) {
  ASSERT_TRUE(bridge_.begin());
  EXPECT_TRUE(board_.hasEdgeHandler());
  EXPECT_EQ(PIN_BUTTON, board_.edgePin());
}

TEST_F(InterruptBridgeTest, EachPressAdvancesModeAndRaisesFlags) {
  ASSERT_TRUE(bridge_.begin());

  press();
  EXPECT_EQ(OperatingMode::MANUAL, context_.mode());
  EXPECT_TRUE(context_.takeModeSwitch());
  EXPECT_TRUE(context_.takeActuationAbort());

  press();
  EXPECT_EQ(OperatingMode::CALIBRATION, context_.mode());
  press();
  EXPECT_EQ(OperatingMode::AUTOMATIC, context_.mode());
  EXPECT_EQ(3u, bridge_.acceptedEdges());
  EXPECT_EQ(FaultCode::NONE, context_.fault());
}

TEST_F(InterruptBridgeTest, NPressesLandOnNModThree) {
  ASSERT_TRUE(bridge_.begin());
  const OperatingMode cycle[] = {OperatingMode::AUTOMATIC, OperatingMode::MANUAL,
                                 OperatingMode::CALIBRATION};
  for (int n = 1; n <= 8; ++n) {
    press();
    EXPECT_EQ(cycle[n % 3], context_.mode()) << "after " << n << " presses";
  }
}

TEST_F(InterruptBridgeTest, BounceWithinWindowIsIgnored) {
  ASSERT_TRUE(bridge_.begin());

  board_.fireEdge();
  board_.delayMs(5);
  board_.fireEdge();
  board_.delayMs(5);
  board_.fireEdge();

  EXPECT_EQ(OperatingMode::MANUAL, context_.mode());
  EXPECT_EQ(1u, bridge_.acceptedEdges());
  EXPECT_EQ(2u, bridge_.rejectedEdges());

  board_.delayMs(kButtonDebounceMs);
  board_.fireEdge();
  EXPECT_EQ(OperatingMode::CALIBRATION, context_.mode());
}

TEST_F(InterruptBridgeTest, ScheduledEdgeFiresDuringDelay) {
  ASSERT_TRUE(bridge_.begin());
  board_.scheduleEdgeAtMs(1500);
  board_.delayMs(1000);
  EXPECT_FALSE(context_.modeSwitchPending());
  board_.delayMs(1000);
  EXPECT_TRUE(context_.modeSwitchPending());
  EXPECT_EQ(OperatingMode::MANUAL, context_.mode());
}

TEST(InterruptBridgeFaultTest, InvalidModeLatchesFault) {
  FakeBoard board(PIN_TRIG, PIN_ECHO, PIN_LIGHT);
  ControlContext context(static_cast<OperatingMode>(5));
  InterruptBridge bridge(context, board, board, PIN_BUTTON, kButtonDebounceMs);
  ASSERT_TRUE(bridge.begin());

  board.fireEdge();
  EXPECT_EQ(FaultCode::INVALID_MODE, context.fault());
  EXPECT_TRUE(context.modeSwitchPending());
}

TEST(InterruptBridgeFaultTest, NullContextIsIgnored) {
  InterruptBridge::edgeIsr(nullptr);
  SUCCEED();
}

}  // namespace
}  // namespace lc
