#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <functional>
#include <map>

// project headers --------------------------------------
#include "panelkit/access.h"

namespace panelkit {

using FrameRequestId = uint64_t;

/// "Run this before the next visual frame" primitive.
class IFrameScheduler {
public:
  virtual ~IFrameScheduler() = default;

  /// Milliseconds on a monotonic clock.
  virtual double NowMs() const = 0;

  /// `callback` runs once, on the next frame, with the frame time in ms.
  virtual FrameRequestId RequestFrame(std::function<void(double)> callback) = 0;

  /// No-op for ids that already ran or were cancelled.
  virtual void CancelFrame(FrameRequestId id) = 0;
};

/// Frame scheduler pumped by the owner of the render loop.
class FrameScheduler final : public IFrameScheduler {
public:
  explicit FrameScheduler(std::function<double()> clock_ms);
  ~FrameScheduler() override = default;

  PANELKIT_DISALLOW_COPY_MOVE(FrameScheduler);

  double NowMs() const override;
  FrameRequestId RequestFrame(std::function<void(double)> callback) override;
  void CancelFrame(FrameRequestId id) override;

  /// Runs, in request order, every callback requested before this call.
  /// Returns the number of callbacks run.
  size_t RunFrame();

  size_t pending_count() const { return pending_.size(); }

private:
  std::function<double()> clock_ms_;
  std::map<FrameRequestId, std::function<void(double)>> pending_;
  FrameRequestId next_id_ = 1;
};

} // namespace panelkit
