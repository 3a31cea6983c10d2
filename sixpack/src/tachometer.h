#pragma once

// project headers --------------------------------------
#include "instrument.h"

class Tachometer final : public Instrument {
public:
  Tachometer(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~Tachometer() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;

  float needle_deg() const { return needle_deg_; }

protected:
  void DemoTick() override;

private:
  panelkit::AircraftLimits limits_;
  float needle_deg_ = 0.0f;
};
