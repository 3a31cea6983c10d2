#pragma once

/// Deletes copy and move construction and assignment of `T`. Used by types
/// that hand out `this` to schedulers, notifiers or the pointer dispatcher.
#define PANELKIT_DISALLOW_COPY_MOVE(T) \
  T(T const& rhs) = delete; \
  T& operator=(T const& rhs) = delete; \
  T(T&& rhs) = delete; \
  T& operator=(T&& rhs) = delete;
