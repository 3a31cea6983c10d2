#pragma once

// project headers --------------------------------------
#include "instrument.h"

class VerticalSpeedIndicator final : public Instrument {
public:
  VerticalSpeedIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~VerticalSpeedIndicator() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;

  float needle_deg() const { return needle_deg_; }

protected:
  void DemoTick() override;

private:
  float needle_deg_ = 180.0f;
};
