#include <gtest/gtest.h>

#include "log.h"
#include "support/fake_board.h"

namespace lc {
namespace {

using test::CaptureLogSink;

TEST(LoggerTest, EventAndValueLines) {
  CaptureLogSink sink;
  Logger log(&sink);

  log.event(Logger::kInfo, "closing_lid");
  log.value(Logger::kWarn, "unwind_aborted", 12L);
  log.value("SENSORS", "baseline_cm", 165.0f, 2);
  log.text("STATE", "mode", "MANUAL");

  ASSERT_EQ(4u, sink.lines.size());
  EXPECT_EQ("INFO,closing_lid", sink.lines[0]);
  EXPECT_EQ("WARN,unwind_aborted=12", sink.lines[1]);
  EXPECT_EQ("SENSORS,baseline_cm=165.00", sink.lines[2]);
  EXPECT_EQ("STATE,mode=MANUAL", sink.lines[3]);
}

TEST(LoggerTest, FieldRecord) {
  CaptureLogSink sink;
  Logger log(&sink);

  log.begin("ACT");
  log.field("rev");
  log.field(2048L);
  log.field(1.5f, 1);
  log.end();

  ASSERT_EQ(1u, sink.lines.size());
  EXPECT_EQ("ACT,rev,2048,1.5", sink.lines[0]);
}

TEST(LoggerTest, NullSinkDropsEverything) {
  Logger log;
  log.event(Logger::kError, "ignored");
  log.begin("X");
  log.field(1L);
  log.end();

  CaptureLogSink sink;
  log.setSink(&sink);
  log.event(Logger::kOk, "ready");
  ASSERT_EQ(1u, sink.lines.size());
  EXPECT_EQ("OK,ready", sink.lines[0]);
}

}  // namespace
}  // namespace lc
