#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <map>
#include <vector>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/pointer_node.h"
#include "panelkit/vec2.h"

namespace panelkit {

enum class PointerEventType {
  // Native, produced by an IPointerEventSource.
  kMouseMove,
  kMouseDown,
  kMouseUp,
  kMouseOver,
  kMouseOut,
  // Synthetic, produced by PointerDispatcher::SetCapture/ReleaseCapture.
  kSetCapture,
  kReleaseCapture,
};

char const* ToString(PointerEventType type);
bool IsSynthetic(PointerEventType type);

struct PointerEvent final {
  PointerEventType type = PointerEventType::kMouseMove;
  /// Global (window) coordinates.
  Vec2 position;
  /// Resolved by hit testing the dispatcher's root when null.
  PointerNode* target = nullptr;
  int button = 0;
};

class IPointerListener {
public:
  virtual ~IPointerListener() = default;

  /// `local` is `event.position` relative to the registered node's origin.
  virtual void OnPointerEvent(PointerEvent const& event, Vec2 const& local, bool capturing) = 0;

  /// kSetCapture or kReleaseCapture; carries no event payload.
  virtual void OnCaptureNotification(PointerEventType type) = 0;
};

class IPointerEventSink {
public:
  virtual ~IPointerEventSink() = default;

  virtual void Dispatch(PointerEvent const& event) = 0;
};

/// Platform end of the pointer pipeline.
class IPointerEventSource {
public:
  virtual ~IPointerEventSource() = default;

  virtual void Connect(IPointerEventSink* sink) = 0;
  virtual void Disconnect(IPointerEventSink* sink) = 0;
};

/// Routes pointer events to (type, node, listener) registrations, with a single
/// exclusive capture slot. While a node holds the capture, events go only to
/// registrations made against that node, wherever the pointer is.
///
/// Nodes and listeners are not owned and must be unregistered before they die.
class PointerDispatcher final : public IPointerEventSink {
public:
  PointerDispatcher(IPointerEventSource& source, PointerNode& root);
  ~PointerDispatcher() override;

  PANELKIT_DISALLOW_COPY_MOVE(PointerDispatcher);

  /// Throws std::logic_error when the identical registration already exists.
  void Register(PointerEventType type, PointerNode* node, IPointerListener* listener, bool include_descendants = true);
  /// All four fields must match exactly one registration; throws std::logic_error
  /// otherwise. Releases the capture if `node` holds it.
  void Unregister(PointerEventType type, PointerNode* node, IPointerListener* listener, bool include_descendants = true);

  /// Throws std::invalid_argument for synthetic event types.
  void Dispatch(PointerEvent const& event) override;

  void SetCapture(PointerNode* node);
  void ReleaseCapture();

  /// Releases the capture, drops every registration and disconnects from the
  /// source. Throws std::logic_error when called a second time.
  void Dispose();

  PointerNode* capture_node() const { return capture_node_; }
  bool disposed() const { return disposed_; }
  size_t registration_count() const;
  size_t registration_count(PointerEventType type) const;

private:
  struct Registration final {
    uint64_t serial = 0;
    PointerNode* node = nullptr;
    IPointerListener* listener = nullptr;
    bool include_descendants = true;
  };

  bool IsRegistered(PointerEventType type, uint64_t serial) const;
  /// First registration of `type` against `node`.
  Registration const* FindFirst(PointerEventType type, PointerNode const* node) const;

  IPointerEventSource& source_;
  PointerNode& root_;
  std::map<PointerEventType, std::vector<Registration>> registrations_;
  PointerNode* capture_node_ = nullptr;
  uint64_t next_serial_ = 1;
  bool disposed_ = false;
};

} // namespace panelkit
