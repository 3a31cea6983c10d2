#pragma once

// project headers --------------------------------------
#include "instrument.h"

/// Non-linear knots scale with the V-speed arcs of the aircraft's limits.
class AirspeedIndicator final : public Instrument {
public:
  AirspeedIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~AirspeedIndicator() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;

  float needle_deg() const { return needle_deg_; }

protected:
  float DemoPeriodMs() const override { return 2000.0f; }
  void DemoTick() override;

private:
  /// Clock angle of `kias` on the dial.
  float ClockFor(float kias) const;

  panelkit::AircraftLimits limits_;
  float needle_deg_ = 0.0f;
};
