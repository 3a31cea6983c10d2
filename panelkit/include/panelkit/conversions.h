#pragma once

namespace panelkit {

/// Sea-level standard pressure (QNE), inches of mercury.
constexpr float kStandardBarometerInHg = 29.92f;

// Standard-atmosphere pressure altitude.
float MillibarsToFeet(float millibars);
float FeetToMillibars(float feet);
float InchesHgToFeet(float inches_hg);
float FeetToInchesHg(float feet);

float MillibarsToInchesHg(float millibars);
float InchesHgToMillibars(float inches_hg);

/// Maps `input` in [0, 1] onto [0, max] along an exponential curve passing
/// through `mid` at 0.5. Linear when `mid` is exactly half of `max`.
/// Throws std::invalid_argument when `input` is out of range or `mid` is not
/// inside (0, max).
float NonLinearScale(float input, float mid, float max);

} // namespace panelkit
