// TU header --------------------------------------------
#include "panelkit/rotatable.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <utility>

// external headers -------------------------------------
#include <spdlog/spdlog.h>

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "panelkit/lerp.h"

namespace panelkit {

namespace {

float RandomLabelOffset() {
  static std::mt19937 engine{ std::random_device{}() };
  std::uniform_real_distribution<float> dist(0.0f, 360.0f);
  return dist(engine);
}

RotatableConfig Validated(RotatableConfig config) {
  if (!config.rotation_callback && !config.click_callback) {
    throw std::invalid_argument("RotatableControl '" + config.text + "': requires a rotation or click callback");
  }
  if (!(config.radius > 0.0f) || !std::isfinite(config.radius)) {
    throw std::invalid_argument("RotatableControl '" + config.text + "': radius must be positive");
  }
  if (!std::isfinite(config.gear) || !std::isfinite(config.rotation)) {
    throw std::invalid_argument("RotatableControl '" + config.text + "': gear and rotation must be finite");
  }
  return config;
}

} // namespace

RotatableControl::RotatableControl(PointerDispatcher& dispatcher, IFrameScheduler& scheduler, PointerNode& parent, RotatableConfig config)
  : dispatcher_(dispatcher),
    scheduler_(scheduler),
    config_(Validated(std::move(config))),
    node_("knob:" + config_.text, &parent) {
  rotation_ = config_.rotation;
  random_offset_ = config_.randomize ? RandomLabelOffset() : 0.0f;
  pop_state_ = config_.pop_state;
  display_scale_ = pop_state_ ? kPopScale : 1.0f;

  // Hit area is twice the visible radius to ease grabbing small knobs.
  node_.SetCircle(this->Center(), config_.radius * 2.0f);
  this->CenterOn(this->Center());

  for (PointerEventType type : kRegisteredTypes) {
    dispatcher_.Register(type, &node_, this);
  }
}

RotatableControl::~RotatableControl() {
  if (!disposed_) {
    this->Dispose();
  }
}

void RotatableControl::CenterOn(Vec2 const& point) {
  position_ = point;
  node_.SetOrigin(point - this->Center());
}

void RotatableControl::TogglePopout() {
  pop_state_ = !pop_state_;
  spdlog::debug("knob '{}' pop state {}", config_.text, pop_state_);
  this->SetPopScale(pop_state_ ? kPopScale : 1.0f);
}

void RotatableControl::SetPopScale(float scale) {
  animations_.AddLerp("scale", StartLerp(scheduler_, display_scale_, scale, kPopDurationMs, [this](float v) {
    display_scale_ = v;
  }));
}

int RotatableControl::FillGray() const {
  float const normalized = (display_scale_ - 1.0f) / (kPopScale - 1.0f);
  return static_cast<int>(std::floor(normalized * 92.0f));
}

void RotatableControl::OnPointerEvent(PointerEvent const& event, Vec2 const& local, bool capturing) {
  switch (event.type) {
  case PointerEventType::kMouseDown:
    this->OnMouseDown(local);
    break;
  case PointerEventType::kMouseUp:
    this->OnMouseUp(capturing);
    break;
  case PointerEventType::kMouseMove:
    this->OnMouseMove(local, capturing);
    break;
  default:
    break;
  }
}

void RotatableControl::OnCaptureNotification(PointerEventType type) {
  if (type == PointerEventType::kSetCapture) {
    dragging_ = true;
  }
  else if (type == PointerEventType::kReleaseCapture) {
    dragging_ = false;
    last_angle_.reset();
  }
}

void RotatableControl::OnMouseDown(Vec2 const& local) {
  float const angle = AngleFromCenter(this->Center(), local);
  dispatcher_.SetCapture(&node_);
  last_angle_ = angle;
}

void RotatableControl::OnMouseUp(bool capturing) {
  if (capturing && config_.click_callback) {
    config_.click_callback();
  }
  dispatcher_.ReleaseCapture();
  if (config_.popout) {
    this->TogglePopout();
  }
}

void RotatableControl::OnMouseMove(Vec2 const& local, bool capturing) {
  if (!capturing || !config_.rotation_callback) return;

  float const angle = AngleFromCenter(this->Center(), local);
  if (!last_angle_.has_value()) {
    last_angle_ = angle;
    return;
  }

  float const delta = AngularDelta(*last_angle_, angle);
  // Implausibly large single-step motion is dropped, keeping the old reference angle.
  if (std::abs(delta) > kJitterThresholdDeg) return;

  last_angle_ = angle;
  rotation_ += delta;
  config_.rotation_callback(delta * config_.gear);
}

void RotatableControl::Dispose() {
  if (disposed_) {
    throw std::logic_error("RotatableControl '" + config_.text + "': already disposed");
  }
  disposed_ = true;

  if (dispatcher_.capture_node() == &node_) {
    dispatcher_.ReleaseCapture();
  }
  // The dispatcher drops everything itself when it was disposed first.
  if (!dispatcher_.disposed()) {
    for (PointerEventType type : kRegisteredTypes) {
      dispatcher_.Unregister(type, &node_, this);
    }
  }
  animations_.CancelAll();
}

} // namespace panelkit
