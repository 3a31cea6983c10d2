#pragma once

// c++ headers ------------------------------------------
#include <functional>
#include <optional>
#include <string>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/animation_set.h"
#include "panelkit/frame_scheduler.h"
#include "panelkit/pointer_dispatcher.h"
#include "panelkit/pointer_node.h"
#include "panelkit/vec2.h"

namespace panelkit {

struct RotatableConfig final {
  float radius = 30.0f;
  std::string text;
  /// Initial cosmetic rotation of the label, degrees.
  float rotation = 0.0f;
  /// Receives each accepted drag delta multiplied by `gear`.
  std::function<void(float)> rotation_callback;
  std::function<void()> click_callback;
  float gear = 1.0f;
  /// Offsets the label by a random angle so knobs do not all look aligned.
  bool randomize = true;
  /// Toggle the pop state on every pointer release.
  bool popout = false;
  bool pop_state = false;
};

/// Draggable circular knob. Dragging around the center produces rotation
/// deltas; releasing fires the click callback. Needs at least one of the two.
class RotatableControl final : public IPointerListener {
public:
  static constexpr float kJitterThresholdDeg = 20.0f;
  static constexpr float kPopScale = 1.25f;
  static constexpr float kPopDurationMs = 200.0f;

  /// Throws std::invalid_argument on a config without callbacks, with a
  /// non-positive radius or a non-finite gear.
  RotatableControl(PointerDispatcher& dispatcher, IFrameScheduler& scheduler, PointerNode& parent, RotatableConfig config);
  ~RotatableControl() override;

  PANELKIT_DISALLOW_COPY_MOVE(RotatableControl);

  /// `point` is in the parent node's coordinates.
  void CenterOn(Vec2 const& point);
  void TogglePopout();
  /// Animates the display scale toward `scale`.
  void SetPopScale(float scale);

  /// Brightness of the knob face, 0 at rest and 92 fully popped out.
  int FillGray() const;
  float TextRotationDeg() const { return rotation_ + random_offset_; }

  void OnPointerEvent(PointerEvent const& event, Vec2 const& local, bool capturing) override;
  void OnCaptureNotification(PointerEventType type) override;

  /// Throws std::logic_error when called a second time.
  void Dispose();

  float radius() const { return config_.radius; }
  std::string const& text() const { return config_.text; }
  Vec2 const& position() const { return position_; }
  float rotation() const { return rotation_; }
  float display_scale() const { return display_scale_; }
  bool pop_state() const { return pop_state_; }
  bool is_dragging() const { return dragging_; }
  std::optional<float> last_angle() const { return last_angle_; }
  PointerNode& node() { return node_; }
  bool disposed() const { return disposed_; }

private:
  static constexpr PointerEventType kRegisteredTypes[] = {
    PointerEventType::kMouseMove,
    PointerEventType::kMouseDown,
    PointerEventType::kMouseUp,
    PointerEventType::kSetCapture,
    PointerEventType::kReleaseCapture,
  };

  Vec2 Center() const { return Vec2{ config_.radius, config_.radius }; }

  void OnMouseDown(Vec2 const& local);
  void OnMouseUp(bool capturing);
  void OnMouseMove(Vec2 const& local, bool capturing);

  PointerDispatcher& dispatcher_;
  IFrameScheduler& scheduler_;
  RotatableConfig config_;
  PointerNode node_;
  KeyedAnimationSet animations_;

  Vec2 position_;
  float rotation_ = 0.0f;
  float random_offset_ = 0.0f;
  float display_scale_ = 1.0f;
  bool pop_state_ = false;
  bool dragging_ = false;
  std::optional<float> last_angle_;
  bool disposed_ = false;
};

} // namespace panelkit
