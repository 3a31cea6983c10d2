// TU header --------------------------------------------
#include "turn_coordinator.h"

// project headers --------------------------------------
#include "panelkit/gauge_scales.h"
#include "primitives.h"

TurnCoordinator::TurnCoordinator(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "turn-coordinator", origin) {
  this->OnChanged(aircraft_);
}

void TurnCoordinator::OnChanged(panelkit::Aircraft const& aircraft) {
  airplane_deg_ = panelkit::TurnRateToAngle(aircraft.roll_rate());
  ball_deg_ = panelkit::SlipBallAngle(aircraft.yaw());
}

void TurnCoordinator::DemoTick() {
  aircraft_.SetRollRate(this->RandomUniform(-panelkit::kMaxRollRate, panelkit::kMaxRollRate));
  aircraft_.SetYaw(this->RandomUniform(-panelkit::kMaxYaw, panelkit::kMaxYaw));
}

void TurnCoordinator::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  // Wings-level and standard-rate marks on both sides.
  for (float deg : { 0.0f, panelkit::kTwoMinuteTurnDeg, 180.0f, 180.0f + panelkit::kTwoMinuteTurnDeg }) {
    DrawTick(center, radius * 0.88f, radius * 0.14f, deg, 5.0f, RAYWHITE);
  }
  DrawTextCentered("L", PointOnCircle(center, radius * 0.66f, 180.0f + panelkit::kTwoMinuteTurnDeg), 24.0f, RAYWHITE);
  DrawTextCentered("R", PointOnCircle(center, radius * 0.66f, panelkit::kTwoMinuteTurnDeg), 24.0f, RAYWHITE);
  DrawTextCentered("TURN COORDINATOR", center + raylib::Vector2{ 0.0f, -radius * 0.45f }, 16.0f, LIGHTGRAY);
  DrawTextCentered("2 MIN", center + raylib::Vector2{ 0.0f, radius * 0.30f }, 16.0f, LIGHTGRAY);

  // Inclinometer tube, spanning the ball's travel plus its radius.
  float const tube = radius * 0.62f;
  float const travel = panelkit::kInclinometerSweepDeg + 5.0f;
  DrawClockArc(center, tube - 12.0f, tube + 12.0f, 180.0f - travel, 180.0f + travel, Color{ 215, 215, 190, 255 });
  DrawTick(center, tube + 12.0f, 24.0f, 90.0f - 3.5f, 2.0f, BLACK);
  DrawTick(center, tube + 12.0f, 24.0f, 90.0f + 3.5f, 2.0f, BLACK);
  DrawCircleV(PointOnCircle(center, tube, ball_deg_), 10.0f, BLACK);

  DrawAirplaneSymbol(center, radius * 1.3f, airplane_deg_, RAYWHITE);
}
