#pragma once

// c++ headers ------------------------------------------
#include <cstdarg>

// external headers -------------------------------------
#include "imgui.h"

// project headers --------------------------------------
#include "panelkit/aircraft.h"

/// Slider whose visible label may change (e.g. with the language) without
/// changing its ImGui id.
bool SliderFloatWithId(
  char const* str_id,
  float* v,
  float v_min,
  float v_max,
  char const* value_format,
  ImGuiSliderFlags flags,
  char const* label_format,
  ...
);

bool SliderFloatWithIdV(
  char const* str_id,
  float* v,
  float v_min,
  float v_max,
  char const* value_format,
  ImGuiSliderFlags flags,
  char const* label_format,
  va_list args
);

/// One slider per aircraft field, editing its target. Returns the number of
/// fields changed this frame.
int AircraftFieldSliders(panelkit::Aircraft& aircraft);
