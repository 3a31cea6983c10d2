// TU header --------------------------------------------
#include "attitude.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <algorithm>

// external headers -------------------------------------
#include "spdlog/spdlog.h"

// project headers --------------------------------------
#include "panelkit/lerp.h"
#include "knob.h"
#include "primitives.h"

namespace {

constexpr Color kSky{ 40, 110, 200, 255 };
constexpr Color kEarth{ 130, 80, 35, 255 };

/// Pitch ladder spacing, 10 degrees.
constexpr float kLadderStepPx = panelkit::kPitchToPixels * 10.0f;

} // namespace

AttitudeIndicator::AttitudeIndicator(InstrumentContext const& context, panelkit::Vec2 const& origin)
  : Instrument(context, "attitude", origin),
    adjust_knob_(context.dispatcher, context.scheduler, node_, panelkit::RotatableConfig{
      .text = "ADJ",
      .rotation_callback = [this](float delta) { this->Adjust(delta); },
      .gear = kAdjustGear,
      .randomize = false,
    }),
    cage_knob_(context.dispatcher, context.scheduler, node_, panelkit::RotatableConfig{
      .text = "CAGE",
      .click_callback = [this]() { this->ToggleCage(); },
      .randomize = false,
      .popout = true,
    }) {
  adjust_knob_.CenterOn(panelkit::Vec2{ kSize * 0.15f, kSize * 0.88f });
  cage_knob_.CenterOn(panelkit::Vec2{ kSize * 0.85f, kSize * 0.88f });

  this->OnChanged(aircraft_);
}

void AttitudeIndicator::OnChanged(panelkit::Aircraft const& aircraft) {
  if (caged_) {
    return;
  }
  roll_ = aircraft.roll();
  pitch_ = aircraft.pitch();
  this->Recompute();
}

void AttitudeIndicator::Dispose() {
  Instrument::Dispose();
  adjust_knob_.Dispose();
  cage_knob_.Dispose();
}

void AttitudeIndicator::ToggleCage() {
  caged_ = !caged_;
  spdlog::debug("attitude: {}", caged_ ? "caged" : "uncaged");

  if (!caged_) {
    roll_ = aircraft_.roll();
    pitch_ = aircraft_.pitch();
  }
  animations_.AddLerp("caged", panelkit::StartLerp(
    scheduler_,
    cage_multiplier_,
    caged_ ? 0.0f : 1.0f,
    kCageDurationMs,
    [this](float multiplier) {
      cage_multiplier_ = multiplier;
      this->Recompute();
    }
  ));
}

void AttitudeIndicator::Adjust(float delta_px) {
  adjust_px_ = std::clamp(adjust_px_ + delta_px, -panelkit::kAttitudeAdjustLimitPx, panelkit::kAttitudeAdjustLimitPx);
  this->Recompute();
}

void AttitudeIndicator::DemoTick() {
  aircraft_.SetRoll(this->RandomUniform(-45.0f, 45.0f));
  aircraft_.SetPitch(this->RandomUniform(-20.0f, 20.0f));
}

void AttitudeIndicator::Recompute() {
  display_ = panelkit::ComputeAttitudeDisplay(roll_, pitch_, cage_multiplier_);
}

void AttitudeIndicator::Draw() const {
  raylib::Vector2 const center = this->Center();
  float const radius = kSize * 0.475f;
  float const disc = radius * 0.80f;

  DrawFace(center, radius);

  // The horizon turns against the bank. `down` points from the center into the earth.
  float const down_deg = 90.0f - display_.roll_deg;
  float const horizon = display_.pitch_offset_px + adjust_px_;
  raylib::Vector2 const down = PointOnCircle(raylib::Vector2{ 0.0f, 0.0f }, 1.0f, down_deg);
  raylib::Vector2 const along{ -down.y, down.x };

  DrawCircleV(center, disc, kSky);
  if (horizon <= -disc) {
    DrawCircleV(center, disc, kEarth);
  }
  else if (horizon < disc) {
    float const half_deg = panelkit::RadToDeg(std::acos(horizon / disc));
    raylib::Vector2 const a = PointOnCircle(center, disc, down_deg - half_deg);
    raylib::Vector2 const b = PointOnCircle(center, disc, down_deg + half_deg);
    DrawCircleSector(center, disc, down_deg - half_deg, down_deg + half_deg, 48, kEarth);
    DrawTriangleAnyWinding(center, a, b, horizon > 0.0f ? kSky : kEarth);
    DrawLineEx(a, b, 3.0f, RAYWHITE);
  }

  for (int step = -2; step <= 2; ++step) {
    if (step == 0) {
      continue;
    }
    float const offset = horizon - float(step) * kLadderStepPx;
    if (std::abs(offset) >= disc * 0.8f) {
      continue;
    }
    float const half_length = (step % 2 == 0) ? disc * 0.25f : disc * 0.15f;
    raylib::Vector2 const mid = center + down * offset;
    DrawLineEx(mid - along * half_length, mid + along * half_length, 2.0f, RAYWHITE);
  }

  // Bank scale is fixed; the pointer turns with the disc.
  for (float bank : { -60.0f, -45.0f, -30.0f, -20.0f, -10.0f, 0.0f, 10.0f, 20.0f, 30.0f, 45.0f, 60.0f }) {
    bool const major = bank == 0.0f || std::abs(bank) == 30.0f || std::abs(bank) == 60.0f;
    DrawTick(center, radius * 0.92f, major ? radius * 0.12f : radius * 0.07f, panelkit::ClockToMath(bank), major ? 3.0f : 2.0f, RAYWHITE);
  }
  {
    float const pointer_deg = panelkit::ClockToMath(-display_.roll_deg);
    raylib::Vector2 const tip = PointOnCircle(center, disc * 0.98f, pointer_deg);
    raylib::Vector2 const left = PointOnCircle(center, disc * 0.86f, pointer_deg - 4.0f);
    raylib::Vector2 const right = PointOnCircle(center, disc * 0.86f, pointer_deg + 4.0f);
    DrawTriangleAnyWinding(tip, left, right, ORANGE);
  }

  DrawAirplaneSymbol(center, disc * 1.1f, 0.0f, ORANGE);

  if (caged_) {
    DrawTextCentered("CAGED", center + raylib::Vector2{ 0.0f, radius * 0.55f }, 18.0f, ORANGE);
  }

  DrawKnob(adjust_knob_, this->Origin());
  DrawKnob(cage_knob_, this->Origin());
}
