// c++ headers ------------------------------------------
#include <limits>
#include <stdexcept>
#include <vector>

// external headers -------------------------------------
#include <gtest/gtest.h>

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "panelkit/rotatable.h"
#include "test_support.h"

namespace panelkit {
namespace {

using Type = PointerEventType;

class RotatableControlTest : public ::testing::Test {
protected:
  static constexpr Vec2 kKnobCenter{ 200.0f, 200.0f };

  RotatableControlTest() : root_("root"), dispatcher_(source_, root_) {
    root_.SetRect(Vec2{ 800.0f, 600.0f });
  }

  RotatableConfig RotationConfig(float gear = 1.0f) {
    return RotatableConfig{
      .text = "HDG",
      .rotation_callback = [this](float delta) { deltas_.push_back(delta); },
      .gear = gear,
      .randomize = false,
    };
  }

  /// Global point `radius` away from the knob center at math angle `deg`.
  static Vec2 At(float deg, float radius = 20.0f) {
    return PointOnCircle(kKnobCenter, radius, deg);
  }

  test::ManualFrames frames_;
  test::FakePointerSource source_;
  PointerNode root_;
  PointerDispatcher dispatcher_;
  std::vector<float> deltas_;
};

TEST_F(RotatableControlTest, RejectsIncompleteConfig) {
  EXPECT_THROW(RotatableControl(dispatcher_, frames_.scheduler, root_, RotatableConfig{}), std::invalid_argument);

  RotatableConfig bad_radius = this->RotationConfig();
  bad_radius.radius = 0.0f;
  EXPECT_THROW(RotatableControl(dispatcher_, frames_.scheduler, root_, bad_radius), std::invalid_argument);

  RotatableConfig bad_gear = this->RotationConfig();
  bad_gear.gear = std::numeric_limits<float>::quiet_NaN();
  EXPECT_THROW(RotatableControl(dispatcher_, frames_.scheduler, root_, bad_gear), std::invalid_argument);

  EXPECT_EQ(dispatcher_.registration_count(), 0u);
}

TEST_F(RotatableControlTest, DragDeliversGearedDeltas) {
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, this->RotationConfig(0.25f));
  knob.CenterOn(kKnobCenter);

  source_.Emit(Type::kMouseDown, At(10.0f));
  EXPECT_TRUE(knob.is_dragging());
  EXPECT_EQ(dispatcher_.capture_node(), &knob.node());
  ASSERT_TRUE(knob.last_angle().has_value());
  EXPECT_NEAR(*knob.last_angle(), 10.0f, 1e-3f);

  source_.Emit(Type::kMouseMove, At(25.0f));
  ASSERT_EQ(deltas_.size(), 1u);
  EXPECT_NEAR(deltas_[0], 15.0f * 0.25f, 1e-3f);
  EXPECT_NEAR(knob.rotation(), 15.0f, 1e-3f);
  EXPECT_NEAR(knob.TextRotationDeg(), 15.0f, 1e-3f);

  // Both steps exceed the jitter threshold relative to the kept reference.
  source_.Emit(Type::kMouseMove, At(355.0f));
  source_.Emit(Type::kMouseMove, At(0.0f));
  ASSERT_EQ(deltas_.size(), 1u);
  EXPECT_NEAR(*knob.last_angle(), 25.0f, 1e-3f);
}

TEST_F(RotatableControlTest, CrossesZeroWithSmallSteps) {
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, this->RotationConfig());
  knob.CenterOn(kKnobCenter);

  source_.Emit(Type::kMouseDown, At(350.0f));
  source_.Emit(Type::kMouseMove, At(5.0f));
  source_.Emit(Type::kMouseMove, At(15.0f));

  ASSERT_EQ(deltas_.size(), 2u);
  EXPECT_NEAR(deltas_[0], 15.0f, 1e-3f);
  EXPECT_NEAR(deltas_[1], 10.0f, 1e-3f);
}

TEST_F(RotatableControlTest, JitterSampleIsDiscardedWithoutMovingTheReference) {
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, this->RotationConfig());
  knob.CenterOn(kKnobCenter);

  source_.Emit(Type::kMouseDown, At(10.0f));
  source_.Emit(Type::kMouseMove, At(210.0f));

  EXPECT_TRUE(deltas_.empty());
  ASSERT_TRUE(knob.last_angle().has_value());
  EXPECT_NEAR(*knob.last_angle(), 10.0f, 1e-3f);
  EXPECT_FLOAT_EQ(knob.rotation(), 0.0f);

  source_.Emit(Type::kMouseMove, At(20.0f));
  ASSERT_EQ(deltas_.size(), 1u);
  EXPECT_NEAR(deltas_[0], 10.0f, 1e-3f);
}

TEST_F(RotatableControlTest, CaptureKeepsDragAliveOutsideTheKnob) {
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, this->RotationConfig());
  knob.CenterOn(kKnobCenter);

  source_.Emit(Type::kMouseDown, At(0.0f));
  source_.Emit(Type::kMouseMove, At(12.0f, 900.0f));
  ASSERT_EQ(deltas_.size(), 1u);
  EXPECT_NEAR(deltas_[0], 12.0f, 1e-3f);

  source_.Emit(Type::kMouseUp, At(12.0f, 900.0f));
  EXPECT_FALSE(knob.is_dragging());
  EXPECT_EQ(dispatcher_.capture_node(), nullptr);
  EXPECT_FALSE(knob.last_angle().has_value());

  // Hovering without a press does nothing.
  source_.Emit(Type::kMouseMove, At(10.0f));
  source_.Emit(Type::kMouseMove, At(20.0f));
  EXPECT_EQ(deltas_.size(), 1u);
}

TEST_F(RotatableControlTest, ReleaseWhileCapturedClicks) {
  int clicks = 0;
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, RotatableConfig{
    .text = "CAGE",
    .click_callback = [&]() { ++clicks; },
  });
  knob.CenterOn(kKnobCenter);

  source_.Emit(Type::kMouseDown, At(0.0f));
  source_.Emit(Type::kMouseMove, At(15.0f));
  source_.Emit(Type::kMouseUp, At(15.0f));
  EXPECT_EQ(clicks, 1);

  // Release without a preceding press on the knob.
  source_.Emit(Type::kMouseUp, At(15.0f));
  EXPECT_EQ(clicks, 1);
}

TEST_F(RotatableControlTest, PopoutAnimatesScaleAndFill) {
  RotatableConfig config = this->RotationConfig();
  config.popout = true;
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, config);
  knob.CenterOn(kKnobCenter);
  EXPECT_FLOAT_EQ(knob.display_scale(), 1.0f);
  EXPECT_EQ(knob.FillGray(), 0);

  source_.Emit(Type::kMouseDown, At(0.0f));
  source_.Emit(Type::kMouseUp, At(0.0f));
  EXPECT_TRUE(knob.pop_state());

  frames_.Advance(100.0);
  EXPECT_GT(knob.display_scale(), 1.0f);
  EXPECT_LT(knob.display_scale(), RotatableControl::kPopScale);
  EXPECT_GT(knob.FillGray(), 0);
  EXPECT_LT(knob.FillGray(), 92);

  frames_.RunFor(200.0);
  EXPECT_FLOAT_EQ(knob.display_scale(), RotatableControl::kPopScale);
  EXPECT_EQ(knob.FillGray(), 92);

  knob.TogglePopout();
  EXPECT_FALSE(knob.pop_state());
  frames_.RunFor(300.0);
  EXPECT_FLOAT_EQ(knob.display_scale(), 1.0f);
  EXPECT_EQ(knob.FillGray(), 0);
}

TEST_F(RotatableControlTest, InitialPopStateStartsAtFullScale) {
  RotatableConfig config = this->RotationConfig();
  config.pop_state = true;
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, config);
  EXPECT_FLOAT_EQ(knob.display_scale(), RotatableControl::kPopScale);
  EXPECT_EQ(knob.FillGray(), 92);
}

TEST_F(RotatableControlTest, DisposeUnregistersEverything) {
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, this->RotationConfig());
  EXPECT_EQ(dispatcher_.registration_count(), 5u);

  knob.CenterOn(kKnobCenter);
  source_.Emit(Type::kMouseDown, At(0.0f));
  knob.Dispose();

  EXPECT_EQ(dispatcher_.registration_count(), 0u);
  EXPECT_EQ(dispatcher_.capture_node(), nullptr);
  EXPECT_FALSE(knob.is_dragging());
  EXPECT_THROW(knob.Dispose(), std::logic_error);
}

TEST_F(RotatableControlTest, RandomizedLabelKeepsRotationSeparate) {
  RotatableConfig config = this->RotationConfig();
  config.randomize = true;
  config.rotation = 30.0f;
  RotatableControl knob(dispatcher_, frames_.scheduler, root_, config);

  EXPECT_FLOAT_EQ(knob.rotation(), 30.0f);
  EXPECT_GE(knob.TextRotationDeg(), 30.0f);
  EXPECT_LT(knob.TextRotationDeg(), 390.0f);
}

TEST_F(RotatableControlTest, UnrandomizedLabelsStayUpright) {
  int clicks = 0;
  RotatableControl cage(dispatcher_, frames_.scheduler, root_, RotatableConfig{
    .text = "CAGE",
    .click_callback = [&clicks]() { ++clicks; },
    .randomize = false,
    .popout = true,
  });
  cage.CenterOn(kKnobCenter);
  EXPECT_EQ(cage.TextRotationDeg(), 0.0f);

  source_.Emit(Type::kMouseDown, At(0.0f));
  source_.Emit(Type::kMouseUp, At(0.0f));
  EXPECT_EQ(clicks, 1);
  EXPECT_EQ(cage.TextRotationDeg(), 0.0f);
}

} // namespace
} // namespace panelkit
