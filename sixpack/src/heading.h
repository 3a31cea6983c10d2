#pragma once

// project headers --------------------------------------
#include "panelkit/rotatable.h"
#include "instrument.h"

/// Directional gyro. SET aligns the card with the magnetic compass, HDG moves
/// the heading bug.
class HeadingIndicator final : public Instrument {
public:
  static constexpr float kKnobGear = 0.25f;

  HeadingIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin);
  ~HeadingIndicator() override = default;

  void Draw() const override;
  void OnChanged(panelkit::Aircraft const& aircraft) override;
  void Dispose() override;

  void AdjustOffset(float delta_deg);
  void AdjustBug(float delta_deg);

  /// Heading shown under the lubber line, in [0, 360).
  float displayed_heading() const { return displayed_heading_; }
  float offset() const { return offset_; }
  float bug() const { return bug_; }

protected:
  void DemoTick() override;

private:
  void Recompute();

  float heading_ = 0.0f;
  float offset_ = 0.0f;
  float bug_ = 0.0f;
  float displayed_heading_ = 0.0f;

  panelkit::RotatableControl set_knob_;
  panelkit::RotatableControl bug_knob_;
};
