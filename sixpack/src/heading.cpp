// TU header --------------------------------------------
#include "heading.h"

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "knob.h"
#include "primitives.h"

namespace {

char const* CardLabel(int deg) {
  switch (deg) {
    case 0:   return "N";
    case 90:  return "E";
    case 180: return "S";
    case 270: return "W";
    default:  return TextFormat("%i", deg / 10);
  }
}

} // namespace

HeadingIndicator::HeadingIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "heading", origin),
    set_knob_(context.dispatcher, context.scheduler, node_, panelkit::RotatableConfig{
      .text = "SET",
      .rotation_callback = [this](float delta) { this->AdjustOffset(delta); },
      .gear = kKnobGear,
    }),
    bug_knob_(context.dispatcher, context.scheduler, node_, panelkit::RotatableConfig{
      .text = "HDG",
      .rotation_callback = [this](float delta) { this->AdjustBug(delta); },
      .gear = kKnobGear,
    }) {
  set_knob_.CenterOn(panelkit::Vec2{ kSize * 0.12f, kSize * 0.88f });
  bug_knob_.CenterOn(panelkit::Vec2{ kSize * 0.88f, kSize * 0.88f });

  this->OnChanged(aircraft_);
}

void HeadingIndicator::OnChanged(panelkit::Aircraft const& aircraft) {
  heading_ = aircraft.heading();
  this->Recompute();
}

void HeadingIndicator::Dispose() {
  Instrument::Dispose();
  set_knob_.Dispose();
  bug_knob_.Dispose();
}

void HeadingIndicator::AdjustOffset(float delta_deg) {
  offset_ = panelkit::SignedDegreesToPositive360(offset_ + delta_deg);
  this->Recompute();
}

void HeadingIndicator::AdjustBug(float delta_deg) {
  bug_ = panelkit::SignedDegreesToPositive360(bug_ + delta_deg);
}

void HeadingIndicator::DemoTick() {
  aircraft_.SetHeading(this->RandomUniform(0.0f, 360.0f));
}

void HeadingIndicator::Recompute() {
  displayed_heading_ = panelkit::SignedDegreesToPositive360(heading_ + offset_);
}

void HeadingIndicator::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;

  DrawFace(center, radius);

  // The card turns so the displayed heading sits under the lubber line.
  for (int deg = 0; deg < 360; deg += 5) {
    float const clock = float(deg) - displayed_heading_;
    float const math = panelkit::ClockToMath(clock);
    bool const major = deg % 10 == 0;
    DrawTick(center, radius * 0.88f, major ? radius * 0.11f : radius * 0.06f, math, major ? 3.0f : 1.5f, RAYWHITE);
    if (deg % 30 == 0) {
      DrawTextRotated(CardLabel(deg), PointOnCircle(center, radius * 0.64f, math), 28.0f, clock, RAYWHITE);
    }
  }

  {
    float const math = panelkit::ClockToMath(bug_ - displayed_heading_);
    raylib::Vector2 const a = PointOnCircle(center, radius * 0.90f, math - 3.0f);
    raylib::Vector2 const b = PointOnCircle(center, radius * 0.90f, math + 3.0f);
    raylib::Vector2 const c = PointOnCircle(center, radius * 0.80f, math);
    DrawTriangleAnyWinding(a, b, c, ORANGE);
  }

  // Lubber line and the fixed airplane.
  DrawTick(center, radius * 0.96f, radius * 0.14f, 270.0f, 4.0f, ORANGE);
  DrawAirplaneSymbol(center, radius * 0.50f, 0.0f, ORANGE);

  DrawTextCentered(TextFormat("%03d", int(displayed_heading_) % 360), center + raylib::Vector2{ 0.0f, radius * 0.30f }, 16.0f, LIGHTGRAY);

  DrawKnob(set_knob_, this->Origin());
  DrawKnob(bug_knob_, this->Origin());
}
