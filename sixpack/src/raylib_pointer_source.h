#pragma once

// c++ headers ------------------------------------------
#include <vector>

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/pointer_dispatcher.h"

/// Turns raylib's polled mouse state into pointer events.
class RaylibPointerSource final : public panelkit::IPointerEventSource {
public:
  RaylibPointerSource() = default;
  ~RaylibPointerSource() override = default;

  PANELKIT_DISALLOW_COPY_MOVE(RaylibPointerSource);

  void Connect(panelkit::IPointerEventSink* sink) override;
  void Disconnect(panelkit::IPointerEventSink* sink) override;

  /// Call once per frame. With `blocked`, only window enter and leave are
  /// reported; another layer owns the mouse.
  void Poll(bool blocked);

private:
  void Emit(panelkit::PointerEventType type, raylib::Vector2 const& position);

  std::vector<panelkit::IPointerEventSink*> sinks_;
  raylib::Vector2 last_position_{ -1.0f, -1.0f };
  bool on_screen_ = false;
};
