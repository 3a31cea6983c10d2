#pragma once

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "panelkit/rotatable.h"

/// Knob face, rim and label at the knob's position inside an instrument whose
/// top-left corner is `instrument_origin`.
void DrawKnob(panelkit::RotatableControl const& knob, raylib::Vector2 const& instrument_origin);
