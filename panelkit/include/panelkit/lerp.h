#pragma once

// c++ headers ------------------------------------------
#include <functional>
#include <limits>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/frame_scheduler.h"

namespace panelkit {

/// Stops the animation it was returned for. Calling it again is a no-op.
/// The scheduler the animation runs on must outlive the handle's last call.
using AnimationHandle = std::function<void()>;

/// Drives a value from `from` to `to` over `duration_ms`, calling `on_tick`
/// once per frame starting with the next frame. With `ease`, the curve is
/// sin(f * π/2). The last call always delivers exactly `to`.
///
/// Throws std::invalid_argument on non-finite input, `duration_ms <= 0` or an
/// empty `on_tick`.
AnimationHandle StartLerp(
  IFrameScheduler& scheduler,
  float from,
  float to,
  float duration_ms,
  std::function<void(float)> on_tick,
  bool ease = true
);

/// Calls `callback` on the next frame, then once every `period_ms`.
AnimationHandle StartInterval(
  IFrameScheduler& scheduler,
  float period_ms,
  std::function<void()> callback
);

struct AnimatedValueConfig final {
  float low_limit = std::numeric_limits<float>::lowest();
  float hi_limit = std::numeric_limits<float>::max();
  float duration_ms = 1000.0f;
  /// (current, target)
  std::function<void(float, float)> callback;
};

/// A clamped value whose displayed value animates toward the last target.
class AnimatedValue final {
public:
  AnimatedValue(IFrameScheduler& scheduler, float value, AnimatedValueConfig config = {});
  ~AnimatedValue();

  PANELKIT_DISALLOW_COPY_MOVE(AnimatedValue);

  void SetValue(float value);
  void SetValueImmediate(float value);
  void CancelLerp();

  float value() const { return value_; }
  float current() const { return current_; }

private:
  float Clamp(float value) const;
  void Changed();

  IFrameScheduler& scheduler_;
  AnimatedValueConfig config_;
  float value_ = 0.0f;
  float current_ = 0.0f;
  AnimationHandle lerp_;
};

} // namespace panelkit
