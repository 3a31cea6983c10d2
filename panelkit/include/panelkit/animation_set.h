#pragma once

// c++ headers ------------------------------------------
#include <map>
#include <string>

// project headers --------------------------------------
#include "panelkit/access.h"
#include "panelkit/lerp.h"

namespace panelkit {

/// At most one running animation (lerp or interval) per key.
/// Cancels everything still running when destroyed.
class KeyedAnimationSet final {
public:
  KeyedAnimationSet() = default;
  ~KeyedAnimationSet();

  PANELKIT_DISALLOW_COPY_MOVE(KeyedAnimationSet);

  /// Cancels the animation already stored under `key`, then stores `handle`.
  void AddLerp(std::string const& key, AnimationHandle handle);
  void CancelLerp(std::string const& key);
  void CancelAll();

  bool Contains(std::string const& key) const { return handles_.contains(key); }
  size_t size() const { return handles_.size(); }

private:
  std::map<std::string, AnimationHandle> handles_;
};

} // namespace panelkit
