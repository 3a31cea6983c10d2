// TU header --------------------------------------------
#include "panelkit/frame_scheduler.h"

// c++ headers ------------------------------------------
#include <stdexcept>
#include <utility>

namespace panelkit {

FrameScheduler::FrameScheduler(std::function<double()> clock_ms) : clock_ms_(std::move(clock_ms)) {
  if (!clock_ms_) {
    throw std::invalid_argument("FrameScheduler: empty clock");
  }
}

double FrameScheduler::NowMs() const {
  return clock_ms_();
}

FrameRequestId FrameScheduler::RequestFrame(std::function<void(double)> callback) {
  if (!callback) {
    throw std::invalid_argument("FrameScheduler: empty callback");
  }
  FrameRequestId const id = next_id_++;
  pending_.emplace(id, std::move(callback));
  return id;
}

void FrameScheduler::CancelFrame(FrameRequestId id) {
  pending_.erase(id);
}

size_t FrameScheduler::RunFrame() {
  // Requests made while this frame runs get ids >= `end` and wait for the next one.
  FrameRequestId const end = next_id_;
  double const now = this->NowMs();

  size_t count = 0;
  while (!pending_.empty()) {
    auto it = pending_.begin();
    if (it->first >= end) break;

    std::function<void(double)> callback = std::move(it->second);
    pending_.erase(it);
    callback(now);
    ++count;
  }
  return count;
}

} // namespace panelkit
