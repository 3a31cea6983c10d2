// TU header --------------------------------------------
#include "airspeed.h"

// c++ headers ------------------------------------------
#include <algorithm>

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "panelkit/gauge_scales.h"
#include "primitives.h"

AirspeedIndicator::AirspeedIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "airspeed", origin),
    limits_(context.aircraft.limits()) {
  this->OnChanged(aircraft_);
}

void AirspeedIndicator::OnChanged(panelkit::Aircraft const& aircraft) {
  float const kias = std::clamp(aircraft.airspeed(), 0.0f, limits_.max_displayed_speed);
  needle_deg_ = panelkit::AirspeedToAngle(kias, limits_);
}

void AirspeedIndicator::DemoTick() {
  aircraft_.SetAirspeed(this->RandomUniform(limits_.vs0, limits_.vne));
}

float AirspeedIndicator::ClockFor(float kias) const {
  return panelkit::MathToClock(panelkit::AirspeedToAngle(kias, limits_));
}

void AirspeedIndicator::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  // Flap range inside, normal range and caution range outside.
  DrawClockArc(center, radius * 0.70f, radius * 0.76f, this->ClockFor(limits_.vs0), this->ClockFor(limits_.vfe), RAYWHITE);
  DrawClockArc(center, radius * 0.76f, radius * 0.84f, this->ClockFor(limits_.vs1), this->ClockFor(limits_.vno), Color{ 0, 170, 60, 255 });
  DrawClockArc(center, radius * 0.76f, radius * 0.84f, this->ClockFor(limits_.vno), this->ClockFor(limits_.vne), Color{ 240, 200, 0, 255 });
  DrawTick(center, radius * 0.86f, radius * 0.16f, panelkit::AirspeedToAngle(limits_.vne, limits_), 4.0f, RED);

  for (int kias = 40; kias < int(limits_.max_displayed_speed); kias += 5) {
    bool const major = kias % 10 == 0;
    float const deg = panelkit::AirspeedToAngle(float(kias), limits_);
    DrawTick(center, radius * 0.86f, major ? radius * 0.12f : radius * 0.06f, deg, major ? 3.0f : 1.5f, RAYWHITE);
    if (kias % 20 == 0) {
      DrawTextCentered(TextFormat("%i", kias), PointOnCircle(center, radius * 0.58f, deg), 22.0f, RAYWHITE);
    }
  }

  DrawTextCentered("AIRSPEED", center + raylib::Vector2{ 0.0f, -radius * 0.28f }, 16.0f, LIGHTGRAY);
  DrawTextCentered("KNOTS", center + raylib::Vector2{ 0.0f, radius * 0.28f }, 16.0f, LIGHTGRAY);

  DrawNeedle(center, radius * 0.80f, radius * 0.15f, 10.0f, needle_deg_, RAYWHITE);
}
