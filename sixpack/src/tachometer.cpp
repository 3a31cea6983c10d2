// TU header --------------------------------------------
#include "tachometer.h"

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "panelkit/gauge_scales.h"
#include "primitives.h"

Tachometer::Tachometer(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "tachometer", origin),
    limits_(context.aircraft.limits()) {
  this->OnChanged(aircraft_);
}

void Tachometer::OnChanged(panelkit::Aircraft const& aircraft) {
  needle_deg_ = panelkit::RpmToAngle(aircraft.rpm());
}

void Tachometer::DemoTick() {
  aircraft_.SetRpm(this->RandomUniform(0.0f, limits_.red_line_rpm));
}

void Tachometer::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  DrawClockArc(
    center, radius * 0.80f, radius * 0.88f,
    panelkit::MathToClock(panelkit::RpmToAngle(limits_.green_min_rpm)),
    panelkit::MathToClock(panelkit::RpmToAngle(limits_.red_line_rpm)),
    Color{ 0, 170, 60, 255 }
  );
  DrawTick(center, radius * 0.90f, radius * 0.18f, panelkit::RpmToAngle(limits_.red_line_rpm), 5.0f, RED);

  int const max_rpm = int(panelkit::kTachometerMaxRpm);
  for (int rpm = 0; rpm <= max_rpm; rpm += 100) {
    bool const major = rpm % 500 == 0;
    float const deg = panelkit::RpmToAngle(float(rpm));
    DrawTick(center, radius * 0.90f, major ? radius * 0.12f : radius * 0.05f, deg, major ? 3.0f : 1.5f, RAYWHITE);
    if (major) {
      DrawTextCentered(TextFormat("%i", rpm / 100), PointOnCircle(center, radius * 0.64f, deg), 24.0f, RAYWHITE);
    }
  }

  DrawTextCentered("RPM", center + raylib::Vector2{ 0.0f, -radius * 0.25f }, 18.0f, LIGHTGRAY);
  DrawTextCentered("X100", center + raylib::Vector2{ 0.0f, radius * 0.25f }, 14.0f, LIGHTGRAY);

  DrawNeedle(center, radius * 0.82f, radius * 0.15f, 10.0f, needle_deg_, RAYWHITE);
}
