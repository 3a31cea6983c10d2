#pragma once

// project headers --------------------------------------
#include "panelkit/gauge_scales.h"
#include "panelkit/lerp.h"
#include "panelkit/rotatable.h"
#include "instrument.h"

/// Three-needle altimeter with a Kollsman window and a barometer knob.
class Altimeter final : public Instrument {
public:
  static constexpr float kBaroGear = 0.0025f;
  static constexpr float kBarberPoleDurationMs = 2000.0f;

  Altimeter(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~Altimeter() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;
  void Dispose() override;

  /// Turns the barometer by `delta_in_hg`, clamped to the Kollsman range.
  void AdjustBarometer(float delta_in_hg);

  panelkit::AltimeterNeedles const& needles() const { return needles_; }
  float barber_pole_alpha() const { return barber_pole_.current(); }

protected:
  void DemoTick() override;

private:
  void DrawKollsmanWindow(raylib::Vector2 const& center, float radius) const;

  panelkit::AltimeterNeedles needles_;
  float barometer_ = panelkit::kStandardBarometerInHg;
  float kollsman_rotation_ = 0.0f;

  panelkit::AnimatedValue barber_pole_;
  panelkit::RotatableControl baro_knob_;
};
