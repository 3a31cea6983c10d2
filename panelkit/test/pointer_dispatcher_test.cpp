// c++ headers ------------------------------------------
#include <stdexcept>
#include <vector>

// external headers -------------------------------------
#include <gtest/gtest.h>

// project headers --------------------------------------
#include "panelkit/pointer_dispatcher.h"
#include "panelkit/pointer_node.h"
#include "test_support.h"

namespace panelkit {
namespace {

using Type = PointerEventType;

TEST(PointerNode, HitTestFindsDeepestTopmostNode) {
  PointerNode root("root");
  root.SetRect(Vec2{ 800.0f, 600.0f });
  PointerNode panel("panel", &root);
  panel.SetOrigin(Vec2{ 100.0f, 100.0f });
  panel.SetRect(Vec2{ 200.0f, 200.0f });
  PointerNode under("under", &panel);
  under.SetOrigin(Vec2{ 10.0f, 10.0f });
  under.SetRect(Vec2{ 50.0f, 50.0f });
  PointerNode over("over", &panel);
  over.SetOrigin(Vec2{ 5.0f, 5.0f });
  over.SetCircle(Vec2{ 0.0f, 0.0f }, 10.0f);

  // Overlap goes to the later sibling.
  EXPECT_EQ(root.HitTest(Vec2{ 111.0f, 111.0f }), &over);
  EXPECT_EQ(root.HitTest(Vec2{ 150.0f, 150.0f }), &under);
  EXPECT_EQ(root.HitTest(Vec2{ 250.0f, 250.0f }), &panel);
  EXPECT_EQ(root.HitTest(Vec2{ 5.0f, 5.0f }), &root);
  EXPECT_EQ(root.HitTest(Vec2{ 900.0f, 5.0f }), nullptr);

  // Circle reaching outside its parent's rectangle still hits.
  EXPECT_EQ(root.HitTest(Vec2{ 105.0f, 97.0f }), &over);

  EXPECT_TRUE(over.IsDescendantOf(&root));
  EXPECT_TRUE(over.IsDescendantOf(&panel));
  EXPECT_FALSE(over.IsDescendantOf(&over));
  EXPECT_FALSE(panel.IsDescendantOf(&over));
  EXPECT_EQ(over.GlobalOrigin(), (Vec2{ 105.0f, 105.0f }));
}

TEST(PointerNode, DestroyedChildDetachesFromParent) {
  PointerNode root("root");
  {
    PointerNode child("child", &root);
    EXPECT_EQ(root.children().size(), 1u);
  }
  EXPECT_TRUE(root.children().empty());
  EXPECT_THROW(root.SetCircle(Vec2{}, 0.0f), std::invalid_argument);
}

class PointerDispatcherTest : public ::testing::Test {
protected:
  PointerDispatcherTest() : root_("root"), x_("x", &root_), y_("y", &root_), y_child_("y-child", &y_) {
    root_.SetRect(Vec2{ 800.0f, 600.0f });
    x_.SetOrigin(Vec2{ 100.0f, 100.0f });
    x_.SetRect(Vec2{ 50.0f, 50.0f });
    y_.SetOrigin(Vec2{ 300.0f, 100.0f });
    y_.SetRect(Vec2{ 50.0f, 50.0f });
    y_child_.SetOrigin(Vec2{ 10.0f, 10.0f });
    y_child_.SetRect(Vec2{ 10.0f, 10.0f });
  }

  test::FakePointerSource source_;
  PointerNode root_;
  PointerNode x_;
  PointerNode y_;
  PointerNode y_child_;
};

TEST_F(PointerDispatcherTest, RoutesToTargetWithLocalCoordinates) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener on_x;
  test::RecordingListener on_y;
  dispatcher.Register(Type::kMouseDown, &x_, &on_x);
  dispatcher.Register(Type::kMouseDown, &y_, &on_y);

  source_.Emit(Type::kMouseDown, Vec2{ 110.0f, 120.0f });

  ASSERT_EQ(on_x.calls.size(), 1u);
  EXPECT_EQ(on_x.calls[0].target, &x_);
  EXPECT_EQ(on_x.calls[0].local, (Vec2{ 10.0f, 20.0f }));
  EXPECT_FALSE(on_x.calls[0].capturing);
  EXPECT_TRUE(on_y.calls.empty());

  // Other event types are not delivered.
  source_.Emit(Type::kMouseUp, Vec2{ 110.0f, 120.0f });
  EXPECT_EQ(on_x.calls.size(), 1u);
}

TEST_F(PointerDispatcherTest, DescendantTargetsFollowTheRegistrationFlag) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener with_descendants;
  test::RecordingListener exact_only;
  dispatcher.Register(Type::kMouseMove, &y_, &with_descendants, true);
  dispatcher.Register(Type::kMouseMove, &y_, &exact_only, false);

  source_.Emit(Type::kMouseMove, Vec2{ 315.0f, 115.0f });
  ASSERT_EQ(with_descendants.calls.size(), 1u);
  EXPECT_EQ(with_descendants.calls[0].target, &y_child_);
  EXPECT_EQ(with_descendants.calls[0].local, (Vec2{ 15.0f, 15.0f }));
  EXPECT_TRUE(exact_only.calls.empty());

  source_.Emit(Type::kMouseMove, Vec2{ 340.0f, 140.0f });
  EXPECT_EQ(with_descendants.calls.size(), 2u);
  EXPECT_EQ(exact_only.calls.size(), 1u);
}

TEST_F(PointerDispatcherTest, SeveralListenersOnOneNodeAllFire) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener a;
  test::RecordingListener b;
  dispatcher.Register(Type::kMouseOver, &x_, &a);
  dispatcher.Register(Type::kMouseOver, &x_, &b);

  source_.Emit(Type::kMouseOver, Vec2{ 101.0f, 101.0f });
  EXPECT_EQ(a.calls.size(), 1u);
  EXPECT_EQ(b.calls.size(), 1u);
}

TEST_F(PointerDispatcherTest, CaptureRedirectsEventsToTheCapturedNodeOnly) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener on_x;
  test::RecordingListener on_y;
  dispatcher.Register(Type::kMouseMove, &x_, &on_x);
  dispatcher.Register(Type::kMouseMove, &y_, &on_y);

  dispatcher.SetCapture(&x_);
  source_.Emit(Type::kMouseMove, Vec2{ 310.0f, 110.0f });

  ASSERT_EQ(on_x.calls.size(), 1u);
  EXPECT_TRUE(on_x.calls[0].capturing);
  EXPECT_EQ(on_x.calls[0].local, (Vec2{ 210.0f, 10.0f }));
  EXPECT_TRUE(on_y.calls.empty());

  // Outside every node.
  source_.Emit(Type::kMouseMove, Vec2{ 2000.0f, 2000.0f });
  EXPECT_EQ(on_x.calls.size(), 2u);

  dispatcher.ReleaseCapture();
  source_.Emit(Type::kMouseMove, Vec2{ 310.0f, 110.0f });
  EXPECT_EQ(on_x.calls.size(), 2u);
  ASSERT_EQ(on_y.calls.size(), 1u);
  EXPECT_FALSE(on_y.calls[0].capturing);
}

TEST_F(PointerDispatcherTest, CaptureHooksFireOncePerTransition) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener hooks_x;
  test::RecordingListener hooks_y;
  dispatcher.Register(Type::kSetCapture, &x_, &hooks_x);
  dispatcher.Register(Type::kReleaseCapture, &x_, &hooks_x);
  dispatcher.Register(Type::kSetCapture, &y_, &hooks_y);

  dispatcher.SetCapture(&x_);
  EXPECT_EQ(hooks_x.notifications, (std::vector<Type>{ Type::kSetCapture }));
  EXPECT_EQ(dispatcher.capture_node(), &x_);

  // Moving the capture releases the previous holder first.
  dispatcher.SetCapture(&y_);
  EXPECT_EQ(hooks_x.notifications, (std::vector<Type>{ Type::kSetCapture, Type::kReleaseCapture }));
  EXPECT_EQ(hooks_y.notifications, (std::vector<Type>{ Type::kSetCapture }));

  dispatcher.SetCapture(&x_);
  hooks_x.notifications.clear();
  dispatcher.ReleaseCapture();
  dispatcher.ReleaseCapture();
  EXPECT_EQ(hooks_x.notifications, (std::vector<Type>{ Type::kReleaseCapture }));
  EXPECT_EQ(dispatcher.capture_node(), nullptr);
}

TEST_F(PointerDispatcherTest, UnregisteringTheCaptureNodeReleasesCapture) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener listener;
  dispatcher.Register(Type::kMouseMove, &x_, &listener);
  dispatcher.Register(Type::kReleaseCapture, &x_, &listener);

  dispatcher.SetCapture(&x_);
  dispatcher.Unregister(Type::kMouseMove, &x_, &listener);
  EXPECT_EQ(dispatcher.capture_node(), nullptr);
  EXPECT_EQ(listener.notifications, (std::vector<Type>{ Type::kReleaseCapture }));
}

TEST_F(PointerDispatcherTest, RegistrationConsistencyErrorsThrow) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener listener;

  dispatcher.Register(Type::kMouseDown, &x_, &listener, true);
  EXPECT_THROW(dispatcher.Register(Type::kMouseDown, &x_, &listener, true), std::logic_error);
  // A different descendant flag is a different registration.
  dispatcher.Register(Type::kMouseDown, &x_, &listener, false);
  EXPECT_EQ(dispatcher.registration_count(Type::kMouseDown), 2u);

  EXPECT_THROW(dispatcher.Unregister(Type::kMouseDown, &y_, &listener, true), std::logic_error);
  EXPECT_THROW(dispatcher.Unregister(Type::kMouseUp, &x_, &listener, true), std::logic_error);
  dispatcher.Unregister(Type::kMouseDown, &x_, &listener, true);
  EXPECT_THROW(dispatcher.Unregister(Type::kMouseDown, &x_, &listener, true), std::logic_error);

  EXPECT_THROW(dispatcher.Register(Type::kMouseDown, nullptr, &listener), std::invalid_argument);
  EXPECT_THROW(dispatcher.Register(Type::kMouseDown, &x_, nullptr), std::invalid_argument);
  EXPECT_THROW(dispatcher.SetCapture(nullptr), std::invalid_argument);
}

TEST_F(PointerDispatcherTest, SyntheticTypesCannotBeDispatched) {
  PointerDispatcher dispatcher(source_, root_);
  EXPECT_THROW(dispatcher.Dispatch(PointerEvent{ .type = Type::kSetCapture }), std::invalid_argument);
  EXPECT_THROW(dispatcher.Dispatch(PointerEvent{ .type = Type::kReleaseCapture }), std::invalid_argument);
}

TEST_F(PointerDispatcherTest, ListenerUnregisteredMidDispatchIsSkipped) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener first;
  test::RecordingListener second;
  first.on_event = [&](PointerEvent const&) {
    dispatcher.Unregister(Type::kMouseUp, &x_, &second);
  };
  dispatcher.Register(Type::kMouseUp, &x_, &first);
  dispatcher.Register(Type::kMouseUp, &x_, &second);

  source_.Emit(Type::kMouseUp, Vec2{ 110.0f, 110.0f });
  EXPECT_EQ(first.calls.size(), 1u);
  EXPECT_TRUE(second.calls.empty());
}

TEST_F(PointerDispatcherTest, CaptureTakenMidDispatchAppliesFromTheNextEvent) {
  PointerDispatcher dispatcher(source_, root_);
  test::RecordingListener grabber;
  test::RecordingListener bystander;
  grabber.on_event = [&](PointerEvent const&) { dispatcher.SetCapture(&x_); };
  dispatcher.Register(Type::kMouseDown, &root_, &grabber);
  dispatcher.Register(Type::kMouseDown, &x_, &bystander);

  source_.Emit(Type::kMouseDown, Vec2{ 110.0f, 110.0f });
  EXPECT_EQ(grabber.calls.size(), 1u);
  ASSERT_EQ(bystander.calls.size(), 1u);
  EXPECT_FALSE(bystander.calls[0].capturing);

  source_.Emit(Type::kMouseDown, Vec2{ 110.0f, 110.0f });
  EXPECT_EQ(grabber.calls.size(), 1u);
  ASSERT_EQ(bystander.calls.size(), 2u);
  EXPECT_TRUE(bystander.calls[1].capturing);
}

TEST_F(PointerDispatcherTest, DisposeDisconnectsAndClears) {
  test::RecordingListener listener;
  {
    PointerDispatcher dispatcher(source_, root_);
    EXPECT_EQ(source_.sinks.size(), 1u);
    dispatcher.Register(Type::kMouseDown, &x_, &listener);
    dispatcher.Register(Type::kReleaseCapture, &x_, &listener);
    dispatcher.SetCapture(&x_);

    dispatcher.Dispose();
    EXPECT_TRUE(source_.sinks.empty());
    EXPECT_EQ(dispatcher.registration_count(), 0u);
    EXPECT_EQ(dispatcher.capture_node(), nullptr);
    EXPECT_EQ(listener.notifications, (std::vector<Type>{ Type::kReleaseCapture }));
    EXPECT_THROW(dispatcher.Dispose(), std::logic_error);
  }
  {
    PointerDispatcher dispatcher(source_, root_);
    EXPECT_EQ(source_.sinks.size(), 1u);
  }
  EXPECT_TRUE(source_.sinks.empty());
}

} // namespace
} // namespace panelkit
