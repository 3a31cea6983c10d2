// TU header --------------------------------------------
#include "widgets.h"

// c++ headers ------------------------------------------
#include <cstdio>

#include <array>
#include <string>

// project headers --------------------------------------
#include "panelkit/gauge_scales.h"
#include "text.h"

bool SliderFloatWithId(
  char const* str_id,
  float* v,
  float v_min,
  float v_max,
  char const* value_format,
  ImGuiSliderFlags flags,
  char const* label_format,
  ...
) {
  va_list args;
  va_start(args, label_format);
  bool changed = SliderFloatWithIdV(str_id, v, v_min, v_max, value_format, flags, label_format, args);
  va_end(args);
  return changed;
}

bool SliderFloatWithIdV(
  char const* str_id,
  float* v,
  float v_min,
  float v_max,
  char const* value_format,
  ImGuiSliderFlags flags,
  char const* label_format,
  va_list label_args
) {
  std::array<char, 256> buffer { 0 };
  vsnprintf(buffer.data(), buffer.size(), label_format, label_args);
  std::string label = std::string(buffer.data()) + "###" + std::string(str_id);
  return ImGui::SliderFloat(label.c_str(), v, v_min, v_max, value_format, flags);
}

namespace {

struct FieldSlider final {
  panelkit::AircraftField field;
  TextId label;
  float min;
  float max;
  char const* format;
};

} // namespace

int AircraftFieldSliders(panelkit::Aircraft& aircraft) {
  using panelkit::AircraftField;

  panelkit::AircraftLimits const& limits = aircraft.limits();
  std::array<FieldSlider, size_t(AircraftField::kCount)> const sliders = {{
    { AircraftField::kAirspeed,     TextId::kAirspeed,     0.0f,   limits.max_displayed_speed,     "%.0f" },
    { AircraftField::kRpm,          TextId::kRpm,          0.0f,   panelkit::kTachometerMaxRpm,    "%.0f" },
    { AircraftField::kAltitude,     TextId::kAltitude,     0.0f,   limits.service_ceiling + 3000.0f, "%.0f" },
    { AircraftField::kAltitudeRate, TextId::kAltitudeRate, -panelkit::kVsiLimitFpm, panelkit::kVsiLimitFpm, "%.0f" },
    { AircraftField::kBarometer,    TextId::kBarometer,    panelkit::kKollsmanMinInHg, panelkit::kKollsmanMaxInHg, "%.2f" },
    { AircraftField::kHeading,      TextId::kHeading,      0.0f,   359.9f, "%.1f" },
    { AircraftField::kRoll,         TextId::kRoll,         -60.0f, 60.0f,  "%.1f" },
    { AircraftField::kRollRate,     TextId::kRollRate,     -panelkit::kMaxRollRate, panelkit::kMaxRollRate, "%.1f" },
    { AircraftField::kPitch,        TextId::kPitch,        -25.0f, 25.0f,  "%.1f" },
    { AircraftField::kYaw,          TextId::kYaw,          -panelkit::kMaxYaw, panelkit::kMaxYaw, "%.1f" },
    { AircraftField::kYawRate,      TextId::kYawRate,      -10.0f, 10.0f,  "%.1f" },
  }};

  int changed = 0;
  for (FieldSlider const& slider : sliders) {
    float target = aircraft.Target(slider.field);
    if (SliderFloatWithId(
      panelkit::ToString(slider.field), &target, slider.min, slider.max,
      slider.format, ImGuiSliderFlags_AlwaysClamp,
      "%s", GetText(slider.label)
    )) {
      aircraft.Set(slider.field, target);
      ++changed;
    }
    ImGui::SameLine();
    ImGui::TextDisabled("(%s %.1f)", GetText(TextId::kCurrent), aircraft.Get(slider.field));
  }

  ImGui::Separator();
  ImGui::Text("%s: %.0f ft", GetText(TextId::kIndicatedAltitude), aircraft.IndicatedAltitude());

  return changed;
}
