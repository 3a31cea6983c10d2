// c++ headers ------------------------------------------
#include <stdexcept>
#include <vector>

// external headers -------------------------------------
#include <gtest/gtest.h>

// project headers --------------------------------------
#include "panelkit/frame_scheduler.h"
#include "test_support.h"

namespace panelkit {
namespace {

TEST(FrameScheduler, RunsRequestsInOrderWithFrameTime) {
  test::ManualFrames frames;
  std::vector<std::pair<int, double>> runs;
  frames.scheduler.RequestFrame([&](double t) { runs.emplace_back(1, t); });
  frames.scheduler.RequestFrame([&](double t) { runs.emplace_back(2, t); });

  EXPECT_EQ(frames.Advance(16.0), 2u);
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_EQ(runs[0].first, 1);
  EXPECT_EQ(runs[1].first, 2);
  EXPECT_DOUBLE_EQ(runs[0].second, 16.0);
  EXPECT_EQ(frames.scheduler.pending_count(), 0u);
}

TEST(FrameScheduler, RequestsMadeDuringAFrameWaitForTheNext) {
  test::ManualFrames frames;
  int outer = 0;
  int inner = 0;
  frames.scheduler.RequestFrame([&](double) {
    ++outer;
    frames.scheduler.RequestFrame([&](double) { ++inner; });
  });

  frames.Advance(16.0);
  EXPECT_EQ(outer, 1);
  EXPECT_EQ(inner, 0);

  frames.Advance(16.0);
  EXPECT_EQ(inner, 1);
}

TEST(FrameScheduler, CancelledRequestNeverRuns) {
  test::ManualFrames frames;
  int second = 0;
  FrameRequestId second_id = 0;
  frames.scheduler.RequestFrame([&](double) { frames.scheduler.CancelFrame(second_id); });
  second_id = frames.scheduler.RequestFrame([&](double) { ++second; });

  frames.Advance(16.0);
  EXPECT_EQ(second, 0);

  // Unknown ids are ignored.
  frames.scheduler.CancelFrame(second_id);
  frames.scheduler.CancelFrame(12345);
}

TEST(FrameScheduler, RejectsEmptyCallbacks) {
  EXPECT_THROW({ FrameScheduler scheduler(nullptr); }, std::invalid_argument);
  test::ManualFrames frames;
  EXPECT_THROW(frames.scheduler.RequestFrame(nullptr), std::invalid_argument);
}

} // namespace
} // namespace panelkit
