// TU header --------------------------------------------
#include "knob.h"

// project headers --------------------------------------
#include "primitives.h"

void DrawKnob(panelkit::RotatableControl const& knob, raylib::Vector2 const& instrument_origin) {
  raylib::Vector2 const center = instrument_origin + ToScreen(knob.position());
  float const radius = knob.radius() * knob.display_scale();

  unsigned char const gray = static_cast<unsigned char>(40 + knob.FillGray());
  Color const rim = knob.is_dragging() ? Color{ 230, 180, 60, 255 } : Color{ 110, 110, 110, 255 };

  DrawCircleV(center, radius, rim);
  DrawCircleV(center, radius * 0.88f, Color{ gray, gray, gray, 255 });

  // Grip notches turn with the label.
  constexpr int kNotches = 12;
  for (int i = 0; i < kNotches; ++i) {
    float const deg = knob.TextRotationDeg() + 360.0f / float(kNotches) * float(i);
    DrawTick(center, radius, radius * 0.12f, deg, 2.0f, Color{ 20, 20, 20, 255 });
  }

  DrawTextRotated(knob.text().c_str(), center, radius * 0.55f, knob.TextRotationDeg(), RAYWHITE);
}
