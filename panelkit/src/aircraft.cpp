// TU header --------------------------------------------
#include "panelkit/aircraft.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <stdexcept>
#include <string>

// project headers --------------------------------------
#include "panelkit/lerp.h"

namespace panelkit {

void AircraftLimits::Validate() const {
  bool const speeds_ordered =
    0.0f < vs0 && vs0 <= vs1 && vs1 <= vr && vr <= vlof && vlof <= vfe &&
    vfe <= va && va <= vno && vno <= vne && vne <= max_displayed_speed;
  if (!speeds_ordered) {
    throw std::invalid_argument("AircraftLimits: V speeds must be positive and ascending up to the displayed maximum");
  }
  if (!(service_ceiling > 0.0f)) {
    throw std::invalid_argument("AircraftLimits: service ceiling must be positive");
  }
  if (!(0.0f <= idle_rpm && idle_rpm <= green_min_rpm && green_min_rpm < red_line_rpm)) {
    throw std::invalid_argument("AircraftLimits: rpm limits must be ascending");
  }
}

char const* ToString(AircraftField field) {
  switch (field) {
  case AircraftField::kAirspeed:     return "airspeed";
  case AircraftField::kRpm:          return "rpm";
  case AircraftField::kAltitude:     return "altitude";
  case AircraftField::kAltitudeRate: return "altitude-rate";
  case AircraftField::kBarometer:    return "barometer";
  case AircraftField::kHeading:      return "heading";
  case AircraftField::kRoll:         return "roll";
  case AircraftField::kRollRate:     return "roll-rate";
  case AircraftField::kPitch:        return "pitch";
  case AircraftField::kYaw:          return "yaw";
  case AircraftField::kYawRate:      return "yaw-rate";
  case AircraftField::kCount:        break;
  }
  throw std::invalid_argument("ToString: invalid AircraftField");
}

float TransitionMs(AircraftField field) {
  switch (field) {
  case AircraftField::kAirspeed:
  case AircraftField::kRpm:
    return 1000.0f;
  case AircraftField::kHeading:
  case AircraftField::kRoll:
  case AircraftField::kRollRate:
  case AircraftField::kPitch:
  case AircraftField::kYaw:
  case AircraftField::kYawRate:
    return 3000.0f;
  case AircraftField::kAltitude:
  case AircraftField::kAltitudeRate:
  case AircraftField::kBarometer:
    return 4000.0f;
  case AircraftField::kCount:
    break;
  }
  throw std::invalid_argument("TransitionMs: invalid AircraftField");
}

Aircraft::Aircraft(IFrameScheduler& scheduler, AircraftLimits limits)
  : scheduler_(scheduler), limits_(limits), notifier_(*this) {
  limits_.Validate();

  fields_[Index(AircraftField::kBarometer)] = AnimatedField{ kStandardBarometerInHg, kStandardBarometerInHg };

  disposables_.Add([this]() {
    animations_.CancelAll();
    notifier_.RemoveAllListeners();
  });
}

Aircraft::~Aircraft() {
  if (!disposables_.disposed()) {
    this->Dispose();
  }
}

void Aircraft::Set(AircraftField field, float value) {
  if (field == AircraftField::kCount) {
    throw std::invalid_argument("Aircraft::Set: invalid field");
  }
  if (!std::isfinite(value)) {
    throw std::invalid_argument(std::string("Aircraft::Set: non-finite ") + ToString(field));
  }
  if (disposables_.disposed()) {
    throw std::logic_error("Aircraft::Set: aircraft is disposed");
  }

  AnimatedField& f = fields_[Index(field)];
  if (value == f.target) return;

  f.target = value;
  animations_.AddLerp(ToString(field), StartLerp(scheduler_, f.current, value, TransitionMs(field), [this, field](float v) {
    fields_[Index(field)].current = v;
    notifier_.Notify();
  }));
}

void Aircraft::SetBarometer(float inches_hg, bool immediate) {
  if (!immediate) {
    this->Set(AircraftField::kBarometer, inches_hg);
    return;
  }

  if (!std::isfinite(inches_hg)) {
    throw std::invalid_argument("Aircraft::SetBarometer: non-finite value");
  }
  if (disposables_.disposed()) {
    throw std::logic_error("Aircraft::SetBarometer: aircraft is disposed");
  }
  animations_.CancelLerp(ToString(AircraftField::kBarometer));
  fields_[Index(AircraftField::kBarometer)] = AnimatedField{ inches_hg, inches_hg };
  notifier_.Notify();
}

float Aircraft::StaticPressure() const {
  return FeetToInchesHg(this->altitude());
}

float Aircraft::IndicatedAltitude() const {
  return InchesHgToFeet(this->StaticPressure() + (kStandardBarometerInHg - this->barometer()));
}

void Aircraft::Dispose() {
  disposables_.Dispose();
}

} // namespace panelkit
