#include "ac/data/CursorEventHub.hpp"

#include <algorithm>
#include <utility>

namespace ac {

SubscriptionId CursorEventHub::subscribe(CursorEventHandler handler) {
  SubscriptionId id = nextId_++;
  entries_.push_back({id, std::move(handler), false});
  return id;
}

bool CursorEventHub::unsubscribe(SubscriptionId id) {
  for (auto& e : entries_) {
    if (e.id == id && !e.removed) {
      e.removed = true;
      if (emitDepth_ == 0) compact();
      return true;
    }
  }
  return false;
}

void CursorEventHub::emit(const CursorEvent& event) {
  emitDepth_++;
  // Handlers may subscribe while we iterate; only visit the current set.
  std::size_t count = entries_.size();
  for (std::size_t i = 0; i < count; i++) {
    if (entries_[i].removed || !entries_[i].handler) continue;
    CursorEventHandler handler = entries_[i].handler;
    handler(event);
  }
  emitDepth_--;
  if (emitDepth_ == 0) compact();
}

std::size_t CursorEventHub::subscriberCount() const {
  std::size_t n = 0;
  for (const auto& e : entries_) {
    if (!e.removed) n++;
  }
  return n;
}

void CursorEventHub::compact() {
  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [](const Entry& e) { return e.removed; }),
                 entries_.end());
}

} // namespace ac
