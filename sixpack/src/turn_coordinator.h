#pragma once

// project headers --------------------------------------
#include "instrument.h"

class TurnCoordinator final : public Instrument {
public:
  TurnCoordinator(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~TurnCoordinator() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;

  float airplane_deg() const { return airplane_deg_; }
  float ball_deg() const { return ball_deg_; }

protected:
  void DemoTick() override;

private:
  float airplane_deg_ = 0.0f;
  float ball_deg_ = 90.0f;
};
