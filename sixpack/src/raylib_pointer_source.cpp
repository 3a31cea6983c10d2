// TU header --------------------------------------------
#include "raylib_pointer_source.h"

// c++ headers ------------------------------------------
#include <algorithm>
#include <stdexcept>

// project headers --------------------------------------
#include "primitives.h"

using panelkit::PointerEventType;

void RaylibPointerSource::Connect(panelkit::IPointerEventSink* sink) {
  if (sink == nullptr) {
    throw std::invalid_argument("RaylibPointerSource: null sink");
  }
  if (std::find(sinks_.begin(), sinks_.end(), sink) != sinks_.end()) {
    throw std::logic_error("RaylibPointerSource: sink already connected");
  }
  sinks_.push_back(sink);
}

void RaylibPointerSource::Disconnect(panelkit::IPointerEventSink* sink) {
  auto it = std::find(sinks_.begin(), sinks_.end(), sink);
  if (it == sinks_.end()) {
    throw std::logic_error("RaylibPointerSource: sink not connected");
  }
  sinks_.erase(it);
}

void RaylibPointerSource::Poll(bool blocked) {
  raylib::Vector2 const position = raylib::Mouse::GetPosition();

  bool const on_screen = IsCursorOnScreen();
  if (on_screen != on_screen_) {
    on_screen_ = on_screen;
    this->Emit(on_screen ? PointerEventType::kMouseOver : PointerEventType::kMouseOut, position);
  }

  bool const moved = position.x != last_position_.x || position.y != last_position_.y;
  last_position_ = position;
  if (blocked) {
    return;
  }

  if (moved) {
    this->Emit(PointerEventType::kMouseMove, position);
  }
  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
    this->Emit(PointerEventType::kMouseDown, position);
  }
  if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) {
    this->Emit(PointerEventType::kMouseUp, position);
  }
}

void RaylibPointerSource::Emit(PointerEventType type, raylib::Vector2 const& position) {
  panelkit::PointerEvent const event{
    .type = type,
    .position = ToPanel(position),
  };
  // A sink may disconnect while handling the event.
  std::vector<panelkit::IPointerEventSink*> const snapshot = sinks_;
  for (panelkit::IPointerEventSink* sink : snapshot) {
    sink->Dispatch(event);
  }
}
