// TU header --------------------------------------------
#include "vertical_speed.h"

// c++ headers ------------------------------------------
#include <cstdlib>

// project headers --------------------------------------
#include "panelkit/gauge_scales.h"
#include "primitives.h"

VerticalSpeedIndicator::VerticalSpeedIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "vertical-speed", origin) {
  this->OnChanged(aircraft_);
}

void VerticalSpeedIndicator::OnChanged(panelkit::Aircraft const& aircraft) {
  needle_deg_ = panelkit::VerticalSpeedToAngle(aircraft.altitude_rate());
}

void VerticalSpeedIndicator::DemoTick() {
  aircraft_.SetAltitudeRate(this->RandomUniform(-1500.0f, 1500.0f));
}

void VerticalSpeedIndicator::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  int const limit = int(panelkit::kVsiLimitFpm);
  for (int fpm = -limit; fpm <= limit; fpm += 100) {
    bool const major = fpm % 500 == 0;
    float const deg = panelkit::VerticalSpeedToAngle(float(fpm));
    DrawTick(center, radius * 0.90f, major ? radius * 0.13f : radius * 0.06f, deg, major ? 3.0f : 1.5f, RAYWHITE);
    if (major) {
      DrawTextCentered(TextFormat("%i", std::abs(fpm) / 100), PointOnCircle(center, radius * 0.64f, deg), 26.0f, RAYWHITE);
    }
  }

  DrawTextCentered("UP", center + raylib::Vector2{ -radius * 0.30f, -radius * 0.22f }, 16.0f, LIGHTGRAY);
  DrawTextCentered("DOWN", center + raylib::Vector2{ -radius * 0.30f, radius * 0.22f }, 16.0f, LIGHTGRAY);
  DrawTextCentered("VERTICAL SPEED", center + raylib::Vector2{ radius * 0.15f, -radius * 0.05f }, 14.0f, LIGHTGRAY);
  DrawTextCentered("100 FEET PER MIN", center + raylib::Vector2{ radius * 0.15f, radius * 0.08f }, 12.0f, LIGHTGRAY);

  DrawNeedle(center, radius * 0.82f, radius * 0.15f, 10.0f, needle_deg_, RAYWHITE);
}
