// TU header --------------------------------------------
#include "panelkit/animation_set.h"

// c++ headers ------------------------------------------
#include <stdexcept>
#include <utility>

namespace panelkit {

KeyedAnimationSet::~KeyedAnimationSet() {
  this->CancelAll();
}

void KeyedAnimationSet::AddLerp(std::string const& key, AnimationHandle handle) {
  if (!handle) {
    throw std::invalid_argument("KeyedAnimationSet: empty handle for '" + key + "'");
  }
  this->CancelLerp(key);
  handles_.emplace(key, std::move(handle));
}

void KeyedAnimationSet::CancelLerp(std::string const& key) {
  auto it = handles_.find(key);
  if (it == handles_.end()) return;

  AnimationHandle handle = std::move(it->second);
  handles_.erase(it);
  handle();
}

void KeyedAnimationSet::CancelAll() {
  std::map<std::string, AnimationHandle> handles;
  handles.swap(handles_);
  for (auto& [key, handle] : handles) {
    handle();
  }
}

} // namespace panelkit
