// TU header --------------------------------------------
#include "panelkit/pointer_dispatcher.h"

// c++ headers ------------------------------------------
#include <algorithm>
#include <stdexcept>
#include <string>

// external headers -------------------------------------
#include <spdlog/spdlog.h>

namespace panelkit {

char const* ToString(PointerEventType type) {
  switch (type) {
  case PointerEventType::kMouseMove:      return "mousemove";
  case PointerEventType::kMouseDown:      return "mousedown";
  case PointerEventType::kMouseUp:        return "mouseup";
  case PointerEventType::kMouseOver:      return "mouseover";
  case PointerEventType::kMouseOut:       return "mouseout";
  case PointerEventType::kSetCapture:     return "setCapture";
  case PointerEventType::kReleaseCapture: return "releaseCapture";
  }
  return "unknown";
}

bool IsSynthetic(PointerEventType type) {
  return type == PointerEventType::kSetCapture || type == PointerEventType::kReleaseCapture;
}

PointerDispatcher::PointerDispatcher(IPointerEventSource& source, PointerNode& root)
  : source_(source), root_(root) {
  source_.Connect(this);
}

PointerDispatcher::~PointerDispatcher() {
  if (!disposed_) {
    this->Dispose();
  }
}

void PointerDispatcher::Register(PointerEventType type, PointerNode* node, IPointerListener* listener, bool include_descendants) {
  if (node == nullptr || listener == nullptr) {
    throw std::invalid_argument("PointerDispatcher::Register: null node or listener");
  }
  if (disposed_) {
    throw std::logic_error("PointerDispatcher::Register: dispatcher is disposed");
  }

  auto& list = registrations_[type];
  bool const duplicate = std::any_of(list.begin(), list.end(), [&](Registration const& r) {
    return r.node == node && r.listener == listener && r.include_descendants == include_descendants;
  });
  if (duplicate) {
    throw std::logic_error(std::string("PointerDispatcher::Register: duplicate registration for ") + ToString(type) + " on '" + node->name() + "'");
  }

  list.push_back(Registration{
    .serial = next_serial_++,
    .node = node,
    .listener = listener,
    .include_descendants = include_descendants,
  });
}

void PointerDispatcher::Unregister(PointerEventType type, PointerNode* node, IPointerListener* listener, bool include_descendants) {
  auto it = registrations_.find(type);
  size_t removed = 0;
  if (it != registrations_.end()) {
    auto& list = it->second;
    auto const end = std::remove_if(list.begin(), list.end(), [&](Registration const& r) {
      return r.node == node && r.listener == listener && r.include_descendants == include_descendants;
    });
    removed = static_cast<size_t>(list.end() - end);
    list.erase(end, list.end());
  }
  if (removed != 1) {
    throw std::logic_error(std::string("PointerDispatcher::Unregister: expected exactly one match for ") + ToString(type) + ", found " + std::to_string(removed));
  }

  if (node != nullptr && node == capture_node_) {
    this->ReleaseCapture();
  }
}

void PointerDispatcher::Dispatch(PointerEvent const& event) {
  if (IsSynthetic(event.type)) {
    throw std::invalid_argument(std::string("PointerDispatcher::Dispatch: synthetic event type ") + ToString(event.type));
  }
  if (disposed_) {
    throw std::logic_error("PointerDispatcher::Dispatch: dispatcher is disposed");
  }

  auto it = registrations_.find(event.type);
  if (it == registrations_.end() || it->second.empty()) return;

  PointerEvent routed = event;
  if (routed.target == nullptr) {
    routed.target = root_.HitTest(routed.position);
  }

  // Mode and recipients are fixed when dispatch starts.
  PointerNode* const capture = capture_node_;
  std::vector<Registration> const snapshot = it->second;

  SPDLOG_TRACE("dispatch {} at ({}, {}) target '{}' capture '{}'",
    ToString(routed.type), routed.position.x, routed.position.y,
    routed.target ? routed.target->name() : "", capture ? capture->name() : "");

  for (Registration const& r : snapshot) {
    if (!this->IsRegistered(routed.type, r.serial)) continue;

    if (capture != nullptr) {
      if (r.node != capture) continue;
      r.listener->OnPointerEvent(routed, routed.position - r.node->GlobalOrigin(), true);
    }
    else {
      bool const hit =
        routed.target != nullptr &&
        (routed.target == r.node || (r.include_descendants && routed.target->IsDescendantOf(r.node)));
      if (!hit) continue;
      r.listener->OnPointerEvent(routed, routed.position - r.node->GlobalOrigin(), false);
    }
  }
}

void PointerDispatcher::SetCapture(PointerNode* node) {
  if (node == nullptr) {
    throw std::invalid_argument("PointerDispatcher::SetCapture: null node");
  }
  this->ReleaseCapture();
  capture_node_ = node;
  spdlog::debug("pointer capture set on '{}'", node->name());

  if (Registration const* r = this->FindFirst(PointerEventType::kSetCapture, node)) {
    r->listener->OnCaptureNotification(PointerEventType::kSetCapture);
  }
}

void PointerDispatcher::ReleaseCapture() {
  if (capture_node_ == nullptr) return;

  // Cleared first so that the hook observes a released dispatcher.
  PointerNode* const node = capture_node_;
  capture_node_ = nullptr;
  spdlog::debug("pointer capture released from '{}'", node->name());

  if (Registration const* r = this->FindFirst(PointerEventType::kReleaseCapture, node)) {
    r->listener->OnCaptureNotification(PointerEventType::kReleaseCapture);
  }
}

void PointerDispatcher::Dispose() {
  if (disposed_) {
    throw std::logic_error("PointerDispatcher: already disposed");
  }
  this->ReleaseCapture();
  registrations_.clear();
  source_.Disconnect(this);
  disposed_ = true;
}

size_t PointerDispatcher::registration_count() const {
  size_t count = 0;
  for (auto const& [type, list] : registrations_) {
    count += list.size();
  }
  return count;
}

size_t PointerDispatcher::registration_count(PointerEventType type) const {
  auto it = registrations_.find(type);
  return (it == registrations_.end()) ? 0 : it->second.size();
}

bool PointerDispatcher::IsRegistered(PointerEventType type, uint64_t serial) const {
  auto it = registrations_.find(type);
  if (it == registrations_.end()) return false;
  return std::any_of(it->second.begin(), it->second.end(), [serial](Registration const& r) {
    return r.serial == serial;
  });
}

PointerDispatcher::Registration const* PointerDispatcher::FindFirst(PointerEventType type, PointerNode const* node) const {
  auto it = registrations_.find(type);
  if (it == registrations_.end()) return nullptr;
  auto found = std::find_if(it->second.begin(), it->second.end(), [node](Registration const& r) {
    return r.node == node;
  });
  return (found == it->second.end()) ? nullptr : &*found;
}

} // namespace panelkit
