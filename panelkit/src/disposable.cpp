// TU header --------------------------------------------
#include "panelkit/disposable.h"

namespace panelkit {

DisposeList::Token DisposeList::Add(std::function<void()> fn) {
  if (!fn) {
    throw std::invalid_argument("DisposeList: empty function");
  }
  if (disposed_) {
    throw std::logic_error("DisposeList: already disposed");
  }
  Token const token = next_token_++;
  entries_.emplace_back(token, std::move(fn));
  return token;
}

void DisposeList::Remove(Token token) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [token](auto const& entry) {
    return entry.first == token;
  });
  if (it == entries_.end()) {
    throw std::logic_error("DisposeList: unknown token");
  }
  entries_.erase(it);
}

void DisposeList::Dispose() {
  if (disposed_) {
    throw std::logic_error("DisposeList: already disposed");
  }
  disposed_ = true;

  auto entries = std::move(entries_);
  entries_.clear();
  for (auto& [token, fn] : entries) {
    fn();
  }
}

} // namespace panelkit
