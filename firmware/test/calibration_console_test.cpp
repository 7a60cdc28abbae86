#include <gtest/gtest.h>

#include <string.h>

#include <string>

#include "app/calibration_console.h"
#include "support/device_rig.h"

namespace lc {
namespace {

using test::DeviceRig;

class CalibrationConsoleTest : public ::testing::Test {
 protected:
  CalibrationConsoleTest() : rig_(OperatingMode::CALIBRATION) {
    rig_.board.setBrightness(1000);
    rig_.board.setDistance(165.0f);
  }

  void run(const char* command) {
    char line[48];
    strncpy(line, command, sizeof(line) - 1);
    line[sizeof(line) - 1] = '\0';
    rig_.console.handleCommand(line);
  }

  DeviceRig rig_;
};

TEST_F(CalibrationConsoleTest, Help) {
  run("help");
  EXPECT_TRUE(rig_.sink.contains("INFO,commands:help|status|release|jog <signed_steps>"));
}

TEST_F(CalibrationConsoleTest, JogMovesBothWays) {
  run("jog 100");
  EXPECT_EQ(100, rig_.stepper.positionSteps());
  EXPECT_TRUE(rig_.sink.contains("OK,jog_done=100"));
  EXPECT_TRUE(rig_.console.lastJog().completed);

  run("jog -150");
  EXPECT_EQ(-50, rig_.stepper.positionSteps());
  EXPECT_TRUE(rig_.sink.contains("OK,jog_done=150"));
  EXPECT_FALSE(rig_.anyCoilHigh());
}

TEST_F(CalibrationConsoleTest, JogRejectsBadArguments) {
  run("jog");
  EXPECT_TRUE(rig_.sink.contains("ERR,usage:jog <signed_steps>"));

  run("jog 0");
  run("jog 100000");
  run("jog -100000");
  EXPECT_EQ(3u, rig_.sink.countPrefix("ERR,invalid_jog_args"));
  EXPECT_EQ(0, rig_.stepper.positionSteps());
}

TEST_F(CalibrationConsoleTest, JogIsAbortedByButton) {
  rig_.board.scheduleEdgeAtMs(100);
  run("jog 1000");

  EXPECT_FALSE(rig_.console.lastJog().completed);
  EXPECT_LT(rig_.console.lastJog().steps_executed, 1000u);
  EXPECT_EQ(1u, rig_.sink.countPrefix("WARN,jog_aborted="));
  EXPECT_FALSE(rig_.anyCoilHigh());
}

TEST_F(CalibrationConsoleTest, ReleaseDeEnergizes) {
  run("release");
  EXPECT_TRUE(rig_.sink.contains("OK,released"));
  EXPECT_FALSE(rig_.stepper.isEnergized());
}

TEST_F(CalibrationConsoleTest, StatusReportsState) {
  run("jog 12");
  run("status");
  EXPECT_TRUE(rig_.sink.contains("STATE,mode=CALIBRATION"));
  EXPECT_TRUE(rig_.sink.contains("MOTOR,position_steps=12"));
  EXPECT_TRUE(rig_.sink.contains("MOTOR,retract_steps=0"));
  EXPECT_TRUE(rig_.sink.contains("SENSORS,baseline_cm=165.00"));
  EXPECT_TRUE(rig_.sink.contains("SENSORS,stalls=0"));
}

TEST_F(CalibrationConsoleTest, UnknownAndEmptyLines) {
  run("dance");
  EXPECT_TRUE(rig_.sink.contains("ERR,unknown_command"));

  const size_t before = rig_.sink.lines.size();
  run("");
  run("   ");
  EXPECT_EQ(before, rig_.sink.lines.size());
}

TEST_F(CalibrationConsoleTest, PollHandlesOneLineAtATime) {
  rig_.input.push("jog 10");
  rig_.input.push("jog 5");

  EXPECT_TRUE(rig_.console.poll());
  EXPECT_EQ(10, rig_.stepper.positionSteps());
  EXPECT_TRUE(rig_.console.poll());
  EXPECT_EQ(15, rig_.stepper.positionSteps());
  EXPECT_FALSE(rig_.console.poll());
}

}  // namespace
}  // namespace lc
