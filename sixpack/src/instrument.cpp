// TU header --------------------------------------------
#include "instrument.h"

// external headers -------------------------------------
#include "spdlog/spdlog.h"

// project headers --------------------------------------
#include "panelkit/lerp.h"
#include "primitives.h"

Instrument::Instrument(InstrumentContext const& context, char const* name, panelkit::Vec2 const& origin)
  : scheduler_(context.scheduler),
    dispatcher_(context.dispatcher),
    aircraft_(context.aircraft),
    node_(name, &context.panel_node),
    name_(name),
    random_engine_(std::random_device{}()) {
  node_.SetOrigin(origin);
  node_.SetRect(panelkit::Vec2{ kSize, kSize });

  aircraft_.AddListener(this);
  disposables_.Add([this]() { aircraft_.RemoveListener(this); });
  disposables_.Add([this]() { animations_.CancelAll(); });
}

Instrument::~Instrument() {
  if (!this->disposed()) {
    Instrument::Dispose();
  }
}

void Instrument::DemoStart() {
  animations_.AddLerp(kDemoKey, panelkit::StartInterval(scheduler_, this->DemoPeriodMs(), [this]() {
    this->DemoTick();
  }));
  spdlog::debug("{}: demo started", name_);
}

void Instrument::DemoStop() {
  animations_.CancelLerp(kDemoKey);
  spdlog::debug("{}: demo stopped", name_);
}

void Instrument::Dispose() {
  disposables_.Dispose();
}

raylib::Vector2 Instrument::Origin() const {
  return ToScreen(node_.GlobalOrigin());
}

raylib::Vector2 Instrument::Center() const {
  return this->Origin() + raylib::Vector2{ kSize * 0.5f, kSize * 0.5f };
}

float Instrument::RandomUniform(float low, float high) {
  std::uniform_real_distribution<float> distribution(low, high);
  return distribution(random_engine_);
}
