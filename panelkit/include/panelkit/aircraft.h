#pragma once

// c++ headers ------------------------------------------
#include <array>
#include <cstddef>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/animation_set.h"
#include "panelkit/conversions.h"
#include "panelkit/disposable.h"
#include "panelkit/frame_scheduler.h"

namespace panelkit {

/// Static limits, Cessna 172 by default. Speeds in KIAS.
struct AircraftLimits final {
  float vs0 = 40.0f;
  float vs1 = 50.0f;
  float vr = 55.0f;
  float vlof = 60.0f;
  float vfe = 85.0f;
  float va = 95.0f;
  float vno = 130.0f;
  float vne = 157.0f;
  /// Top of the airspeed indicator scale.
  float max_displayed_speed = 200.0f;
  /// Feet.
  float service_ceiling = 17000.0f;

  float idle_rpm = 1000.0f;
  float green_min_rpm = 2000.0f;
  float red_line_rpm = 2700.0f;

  /// Throws std::invalid_argument when the limits are not ordered.
  void Validate() const;
};

enum class AircraftField {
  kAirspeed,      ///< KIAS
  kRpm,
  kAltitude,      ///< feet
  kAltitudeRate,  ///< feet per minute
  kBarometer,     ///< QNH, inches of mercury
  kHeading,       ///< magnetic, degrees
  kRoll,          ///< degrees
  kRollRate,      ///< degrees per second
  kPitch,         ///< degrees
  kYaw,           ///< degrees
  kYawRate,       ///< degrees per second
  kCount,
};

/// Animation key, e.g. "altitude-rate".
char const* ToString(AircraftField field);
/// Length of the transition a setter starts for `field`.
float TransitionMs(AircraftField field);

/// Simulated aircraft. Setters ease each field toward its new target and
/// notify listeners on every animation tick.
class Aircraft final {
public:
  struct AnimatedField final {
    float current = 0.0f;
    float target = 0.0f;
  };

  explicit Aircraft(IFrameScheduler& scheduler, AircraftLimits limits = {});
  ~Aircraft();

  PANELKIT_DISALLOW_COPY_MOVE(Aircraft);

  /// Starts a transition unless `value` already is the target.
  /// Throws std::invalid_argument for a non-finite value.
  void Set(AircraftField field, float value);

  void SetAirspeed(float kias) { this->Set(AircraftField::kAirspeed, kias); }
  void SetRpm(float rpm) { this->Set(AircraftField::kRpm, rpm); }
  void SetAltitude(float feet) { this->Set(AircraftField::kAltitude, feet); }
  void SetAltitudeRate(float fpm) { this->Set(AircraftField::kAltitudeRate, fpm); }
  /// `immediate` skips the transition, used while turning the altimeter knob.
  void SetBarometer(float inches_hg, bool immediate = false);
  void SetHeading(float deg) { this->Set(AircraftField::kHeading, deg); }
  void SetRoll(float deg) { this->Set(AircraftField::kRoll, deg); }
  void SetRollRate(float deg_per_sec) { this->Set(AircraftField::kRollRate, deg_per_sec); }
  void SetPitch(float deg) { this->Set(AircraftField::kPitch, deg); }
  void SetYaw(float deg) { this->Set(AircraftField::kYaw, deg); }
  void SetYawRate(float deg_per_sec) { this->Set(AircraftField::kYawRate, deg_per_sec); }

  float Get(AircraftField field) const { return fields_[Index(field)].current; }
  float Target(AircraftField field) const { return fields_[Index(field)].target; }

  float airspeed() const { return this->Get(AircraftField::kAirspeed); }
  float rpm() const { return this->Get(AircraftField::kRpm); }
  float altitude() const { return this->Get(AircraftField::kAltitude); }
  float altitude_rate() const { return this->Get(AircraftField::kAltitudeRate); }
  float barometer() const { return this->Get(AircraftField::kBarometer); }
  float heading() const { return this->Get(AircraftField::kHeading); }
  float roll() const { return this->Get(AircraftField::kRoll); }
  float roll_rate() const { return this->Get(AircraftField::kRollRate); }
  float pitch() const { return this->Get(AircraftField::kPitch); }
  float yaw() const { return this->Get(AircraftField::kYaw); }
  float yaw_rate() const { return this->Get(AircraftField::kYawRate); }

  /// Standard-atmosphere pressure at the current altitude, inches of mercury.
  float StaticPressure() const;
  /// Altitude read by an altimeter set to the current barometer.
  float IndicatedAltitude() const;

  void AddListener(IChangeListener<Aircraft>* listener) { notifier_.AddListener(listener); }
  void RemoveListener(IChangeListener<Aircraft>* listener) { notifier_.RemoveListener(listener); }

  /// Cancels every transition and drops all listeners.
  /// Throws std::logic_error when called a second time.
  void Dispose();

  AircraftLimits const& limits() const { return limits_; }
  KeyedAnimationSet const& animations() const { return animations_; }
  ChangeNotifier<Aircraft> const& notifier() const { return notifier_; }
  bool disposed() const { return disposables_.disposed(); }

private:
  static constexpr size_t Index(AircraftField field) { return static_cast<size_t>(field); }

  IFrameScheduler& scheduler_;
  AircraftLimits limits_;
  std::array<AnimatedField, static_cast<size_t>(AircraftField::kCount)> fields_{};
  KeyedAnimationSet animations_;
  ChangeNotifier<Aircraft> notifier_;
  DisposeList disposables_;
};

} // namespace panelkit
