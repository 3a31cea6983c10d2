// TU header --------------------------------------------
#include "altimeter.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "knob.h"
#include "primitives.h"

Altimeter::Altimeter(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "altimeter", origin),
    barber_pole_(context.scheduler, 1.0f, panelkit::AnimatedValueConfig{
      .low_limit = 0.0f,
      .hi_limit = 1.0f,
      .duration_ms = kBarberPoleDurationMs,
    }),
    baro_knob_(context.dispatcher, context.scheduler, node_, panelkit::RotatableConfig{
      .text = "BARO",
      .rotation_callback = [this](float delta) { this->AdjustBarometer(delta); },
      .gear = kBaroGear,
    }) {
  baro_knob_.CenterOn(panelkit::Vec2{ kSize * 0.12f, kSize * 0.88f });

  this->OnChanged(aircraft_);
}

void Altimeter::OnChanged(panelkit::Aircraft const& aircraft) {
  needles_ = panelkit::AltitudeToNeedles(aircraft.IndicatedAltitude());
  barber_pole_.SetValue(needles_.barber_pole_visible ? 1.0f : 0.0f);
  barometer_ = aircraft.barometer();
  kollsman_rotation_ = panelkit::KollsmanRotation(barometer_);
}

void Altimeter::Dispose() {
  Instrument::Dispose();
  barber_pole_.CancelLerp();
  baro_knob_.Dispose();
}

void Altimeter::AdjustBarometer(float delta_in_hg) {
  float const value = std::clamp(aircraft_.barometer() + delta_in_hg, panelkit::kKollsmanMinInHg, panelkit::kKollsmanMaxInHg);
  aircraft_.SetBarometer(value, true);
}

void Altimeter::DemoTick() {
  aircraft_.SetAltitude(this->RandomUniform(0.0f, aircraft_.limits().service_ceiling));
  aircraft_.SetBarometer(this->RandomUniform(panelkit::kKollsmanMinInHg, panelkit::kKollsmanMaxInHg));
}

void Altimeter::DrawKollsmanWindow(raylib::Vector2 const& center, float radius) const {
  constexpr float kWindowWidth = 64.0f;
  constexpr float kWindowHeight = 34.0f;

  float const scale_radius = radius * 0.62f;
  raylib::Vector2 const window = center + raylib::Vector2{ scale_radius, 0.0f };

  DrawRectangleV(
    window - raylib::Vector2{ 8.0f, kWindowHeight * 0.5f },
    raylib::Vector2{ kWindowWidth, kWindowHeight },
    Color{ 230, 230, 225, 255 }
  );

  BeginScissorMode(
    int(window.x - 8.0f), int(window.y - kWindowHeight * 0.5f),
    int(kWindowWidth), int(kWindowHeight)
  );
  // The scale turns behind the window so that the set value sits at 3 o'clock.
  for (int hundredths = 2800; hundredths <= 3100; hundredths += 2) {
    float const inches = float(hundredths) / 100.0f;
    float const clock = 90.0f + kollsman_rotation_ - panelkit::KollsmanRotation(inches);
    float const deg = panelkit::ClockToMath(clock);
    bool const labelled = hundredths % 10 == 0;
    DrawTick(center, scale_radius + 6.0f, labelled ? 8.0f : 4.0f, deg, 1.5f, BLACK);
    if (labelled) {
      DrawTextRotated(
        TextFormat("%.1f", inches),
        PointOnCircle(center, scale_radius + 28.0f, deg),
        14.0f,
        clock - 90.0f,
        BLACK
      );
    }
  }
  EndScissorMode();

  DrawTriangleAnyWinding(
    window + raylib::Vector2{ -8.0f, -5.0f },
    window + raylib::Vector2{ -8.0f, 5.0f },
    window + raylib::Vector2{ 0.0f, 0.0f },
    RED
  );
}

void Altimeter::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  this->DrawKollsmanWindow(center, radius);
  DrawBarberPole(center, radius * 0.30f, radius * 0.40f, 330.0f, 30.0f, barber_pole_.current());

  for (int i = 0; i < 50; ++i) {
    bool const major = i % 5 == 0;
    DrawTick(center, radius * 0.90f, major ? radius * 0.12f : radius * 0.06f, panelkit::ClockToMath(7.2f * float(i)), major ? 3.0f : 1.5f, RAYWHITE);
  }
  DrawDialNumbers(center, radius * 0.70f, 0.0f, 36.0f, 10, 0, 1, 28.0f, RAYWHITE);

  DrawTextCentered("ALT", center + raylib::Vector2{ 0.0f, -radius * 0.22f }, 16.0f, LIGHTGRAY);
  DrawTextCentered(TextFormat("%.2f", barometer_), center + raylib::Vector2{ 0.0f, radius * 0.50f }, 14.0f, LIGHTGRAY);

  DrawNeedle(center, radius * 0.85f, 0.0f, 3.0f, needles_.ten_thousands, RAYWHITE);
  DrawNeedle(center, radius * 0.50f, radius * 0.10f, 14.0f, needles_.thousands, RAYWHITE);
  DrawNeedle(center, radius * 0.80f, radius * 0.15f, 8.0f, needles_.hundreds, RAYWHITE);

  DrawKnob(baro_knob_, this->Origin());
}
