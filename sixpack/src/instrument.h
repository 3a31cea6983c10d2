#pragma once

// c++ headers ------------------------------------------
#include <random>

// external headers -------------------------------------
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/aircraft.h"
#include "panelkit/animation_set.h"
#include "panelkit/disposable.h"
#include "panelkit/frame_scheduler.h"
#include "panelkit/pointer_dispatcher.h"
#include "panelkit/pointer_node.h"
#include "panelkit/vec2.h"

/// Services an instrument is mounted with. All of them outlive the instrument.
struct InstrumentContext final {
  panelkit::IFrameScheduler& scheduler;
  panelkit::PointerDispatcher& dispatcher;
  panelkit::Aircraft& aircraft;
  /// Panel node the instrument's own node is attached to.
  panelkit::PointerNode& panel_node;
};

class IInstrument {
public:
  virtual ~IInstrument() = default;

  virtual char const* name() const = 0;

  virtual void Draw() const = 0;

  /// Starts feeding the aircraft random values on a fixed interval.
  virtual void DemoStart() = 0;
  virtual void DemoStop() = 0;
  virtual bool demo_running() const = 0;

  /// Unsubscribes from the aircraft and cancels every animation.
  /// Throws std::logic_error when called a second time.
  virtual void Dispose() = 0;
};

/// Square instrument face listening to the aircraft. Subclasses cache what they
/// draw in OnChanged and only read that cache in Draw.
class Instrument : public IInstrument, public panelkit::IChangeListener<panelkit::Aircraft> {
public:
  static constexpr float kSize = 400.0f;
  static constexpr char const* kDemoKey = "demo";

  /// `origin` is relative to the panel node.
  Instrument(InstrumentContext const& context, char const* name, panelkit::Vec2 const& origin);
  ~Instrument() override;

  PANELKIT_DISALLOW_COPY_MOVE(Instrument);

  char const* name() const override { return name_; }

  void DemoStart() override;
  void DemoStop() override;
  bool demo_running() const override { return animations_.Contains(kDemoKey); }

  void Dispose() override;

  bool disposed() const { return disposables_.disposed(); }

protected:
  virtual float DemoPeriodMs() const { return 5000.0f; }
  virtual void DemoTick() = 0;

  /// Window coordinates of the top-left corner.
  raylib::Vector2 Origin() const;
  raylib::Vector2 Center() const;

  float RandomUniform(float low, float high);

  panelkit::IFrameScheduler& scheduler_;
  panelkit::PointerDispatcher& dispatcher_;
  panelkit::Aircraft& aircraft_;
  panelkit::PointerNode node_;
  panelkit::KeyedAnimationSet animations_;
  panelkit::DisposeList disposables_;

private:
  char const* name_;
  std::mt19937 random_engine_;
};
