// TU header --------------------------------------------
#include "panelkit/lerp.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <utility>

namespace panelkit {

namespace {

struct LerpState final {
  IFrameScheduler& scheduler;
  float from = 0.0f;
  float to = 0.0f;
  double start_ms = 0.0;
  double duration_ms = 0.0;
  bool ease = true;
  std::function<void(float)> on_tick;
  FrameRequestId request = 0;
  bool active = true;
};

void LerpTick(std::shared_ptr<LerpState> const& state, double now_ms) {
  if (!state->active) return;

  float value = state->to;
  double const elapsed = now_ms - state->start_ms;
  if (elapsed < state->duration_ms) {
    double const f = std::max(0.0, elapsed / state->duration_ms);
    double const normalized = state->ease ? std::sin(f * std::numbers::pi * 0.5) : f;
    value = static_cast<float>(state->from + normalized * (state->to - state->from));

    // Scheduled before the tick so that a cancel from inside `on_tick` sticks.
    state->request = state->scheduler.RequestFrame([state](double t) { LerpTick(state, t); });
  }
  else {
    state->active = false;
    state->request = 0;
  }
  state->on_tick(value);
}

struct IntervalState final {
  IFrameScheduler& scheduler;
  double period_ms = 0.0;
  double next_due_ms = 0.0;
  bool leading = true;
  std::function<void()> callback;
  FrameRequestId request = 0;
  bool active = true;
};

void IntervalTick(std::shared_ptr<IntervalState> const& state, double now_ms) {
  if (!state->active) return;

  state->request = state->scheduler.RequestFrame([state](double t) { IntervalTick(state, t); });

  bool due = state->leading;
  state->leading = false;
  if (now_ms >= state->next_due_ms) {
    due = true;
    // Skip missed periods rather than firing a burst.
    while (state->next_due_ms <= now_ms) {
      state->next_due_ms += state->period_ms;
    }
  }
  if (due) {
    state->callback();
  }
}

} // namespace

AnimationHandle StartLerp(
  IFrameScheduler& scheduler,
  float from,
  float to,
  float duration_ms,
  std::function<void(float)> on_tick,
  bool ease
) {
  if (!std::isfinite(from) || !std::isfinite(to) || !std::isfinite(duration_ms)) {
    throw std::invalid_argument("StartLerp: non-finite parameter");
  }
  if (duration_ms <= 0.0f) {
    throw std::invalid_argument("StartLerp: duration must be positive");
  }
  if (!on_tick) {
    throw std::invalid_argument("StartLerp: empty tick callback");
  }

  auto state = std::make_shared<LerpState>(LerpState{
    .scheduler = scheduler,
    .from = from,
    .to = to,
    .start_ms = scheduler.NowMs(),
    .duration_ms = duration_ms,
    .ease = ease,
    .on_tick = std::move(on_tick),
  });
  state->request = scheduler.RequestFrame([state](double t) { LerpTick(state, t); });

  return [state]() {
    if (!state->active) return;
    state->active = false;
    if (state->request != 0) {
      state->scheduler.CancelFrame(state->request);
      state->request = 0;
    }
  };
}

AnimationHandle StartInterval(
  IFrameScheduler& scheduler,
  float period_ms,
  std::function<void()> callback
) {
  if (!std::isfinite(period_ms) || period_ms <= 0.0f) {
    throw std::invalid_argument("StartInterval: period must be positive");
  }
  if (!callback) {
    throw std::invalid_argument("StartInterval: empty callback");
  }

  double const now = scheduler.NowMs();
  auto state = std::make_shared<IntervalState>(IntervalState{
    .scheduler = scheduler,
    .period_ms = period_ms,
    .next_due_ms = now + period_ms,
    .callback = std::move(callback),
  });
  state->request = scheduler.RequestFrame([state](double t) { IntervalTick(state, t); });

  return [state]() {
    if (!state->active) return;
    state->active = false;
    state->scheduler.CancelFrame(state->request);
    state->request = 0;
  };
}

AnimatedValue::AnimatedValue(IFrameScheduler& scheduler, float value, AnimatedValueConfig config)
  : scheduler_(scheduler), config_(std::move(config)) {
  if (!(config_.low_limit <= config_.hi_limit)) {
    throw std::invalid_argument("AnimatedValue: low_limit must not exceed hi_limit");
  }
  if (!std::isfinite(config_.duration_ms) || config_.duration_ms <= 0.0f) {
    throw std::invalid_argument("AnimatedValue: duration must be positive");
  }
  value_ = this->Clamp(value);
  current_ = value_;
}

AnimatedValue::~AnimatedValue() {
  this->CancelLerp();
}

void AnimatedValue::SetValue(float value) {
  float const clamped = this->Clamp(value);
  if (clamped == value_) return;

  this->CancelLerp();
  value_ = clamped;
  lerp_ = StartLerp(scheduler_, current_, value_, config_.duration_ms, [this](float v) {
    current_ = v;
    this->Changed();
  });
}

void AnimatedValue::SetValueImmediate(float value) {
  this->CancelLerp();
  value_ = this->Clamp(value);
  current_ = value_;
  this->Changed();
}

void AnimatedValue::CancelLerp() {
  if (lerp_) {
    AnimationHandle lerp = std::move(lerp_);
    lerp_ = nullptr;
    lerp();
  }
}

float AnimatedValue::Clamp(float value) const {
  if (!std::isfinite(value)) {
    throw std::invalid_argument("AnimatedValue: non-finite value");
  }
  return std::clamp(value, config_.low_limit, config_.hi_limit);
}

void AnimatedValue::Changed() {
  if (config_.callback) {
    config_.callback(current_, value_);
  }
}

} // namespace panelkit
