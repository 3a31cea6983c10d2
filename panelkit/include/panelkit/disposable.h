#pragma once

// c++ headers ------------------------------------------
#include <cstdint>

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

// project headers --------------------------------------
#include "panelkit/access.h"

namespace panelkit {

/// Cleanup callbacks run once, in insertion order, when the owner is disposed.
class DisposeList final {
public:
  using Token = uint64_t;

  DisposeList() = default;
  ~DisposeList() = default;

  PANELKIT_DISALLOW_COPY_MOVE(DisposeList);

  Token Add(std::function<void()> fn);
  /// Throws std::logic_error when `token` is not pending.
  void Remove(Token token);

  /// Throws std::logic_error when called a second time.
  void Dispose();

  bool disposed() const { return disposed_; }
  size_t size() const { return entries_.size(); }

private:
  std::vector<std::pair<Token, std::function<void()>>> entries_;
  Token next_token_ = 1;
  bool disposed_ = false;
};

template<class TSource>
class IChangeListener {
public:
  virtual ~IChangeListener() = default;

  virtual void OnChanged(TSource const& source) = 0;
};

/// Ordered set of change listeners. Does not own the listeners.
template<class TSource>
class ChangeNotifier final {
public:
  using Listener = IChangeListener<TSource>;

  explicit ChangeNotifier(TSource const& source) : source_(source) {}
  ~ChangeNotifier() = default;

  PANELKIT_DISALLOW_COPY_MOVE(ChangeNotifier);

  void AddListener(Listener* listener) {
    if (listener == nullptr) {
      throw std::invalid_argument("ChangeNotifier: null listener");
    }
    if (this->Contains(listener)) {
      throw std::logic_error("ChangeNotifier: listener already added");
    }
    listeners_.push_back(listener);
  }

  void RemoveListener(Listener* listener) {
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it == listeners_.end()) {
      throw std::logic_error("ChangeNotifier: listener not found");
    }
    listeners_.erase(it);
  }

  void RemoveAllListeners() {
    listeners_.clear();
  }

  /// Listeners removed by an earlier listener during the same notification
  /// are skipped; listeners added during it are not called until the next one.
  void Notify() const {
    std::vector<Listener*> const snapshot = listeners_;
    for (Listener* listener : snapshot) {
      if (this->Contains(listener)) {
        listener->OnChanged(source_);
      }
    }
  }

  bool Contains(Listener* listener) const {
    return std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end();
  }
  size_t listener_count() const { return listeners_.size(); }

private:
  TSource const& source_;
  std::vector<Listener*> listeners_;
};

} // namespace panelkit
