#pragma once

// project headers --------------------------------------
#include "panelkit/gauge_scales.h"
#include "panelkit/rotatable.h"
#include "instrument.h"

/// Artificial horizon with a vertical adjustment knob and a caging knob.
class AttitudeIndicator final : public Instrument {
public:
  static constexpr float kAdjustGear = 0.05f;
  static constexpr float kCageDurationMs = 2000.0f;

  AttitudeIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~AttitudeIndicator() override = default;

  void Draw() const override;
  /// Ignored while caged.
  void OnChanged(panelkit::Aircraft const& aircraft) override;
  void Dispose() override;

  void ToggleCage();
  void Adjust(float delta_px);

  bool caged() const { return caged_; }
  float cage_multiplier() const { return cage_multiplier_; }
  float adjust_px() const { return adjust_px_; }
  panelkit::AttitudeDisplay const& display() const { return display_; }

protected:
  void DemoTick() override;

private:
  void Recompute();

  float roll_ = 0.0f;
  float pitch_ = 0.0f;
  float adjust_px_ = 0.0f;
  bool caged_ = false;
  float cage_multiplier_ = 1.0f;
  panelkit::AttitudeDisplay display_;

  panelkit::RotatableControl adjust_knob_;
  panelkit::RotatableControl cage_knob_;
};
