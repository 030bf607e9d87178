#pragma once
#include "ac/data/CursorEvent.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace ac {

using SubscriptionId = std::uint32_t;
using CursorEventHandler = std::function<void(const CursorEvent&)>;

// Fan-out of cursor events to subscribers, in subscription order.
class CursorEventHub {
public:
  SubscriptionId subscribe(CursorEventHandler handler);

  // Returns false if the id is unknown. Safe to call from inside a handler;
  // the removal is applied before the next emit.
  bool unsubscribe(SubscriptionId id);

  void emit(const CursorEvent& event);

  std::size_t subscriberCount() const;

private:
  struct Entry {
    SubscriptionId id;
    CursorEventHandler handler;
    bool removed{false};
  };

  void compact();

  std::vector<Entry> entries_;
  SubscriptionId nextId_{1};
  int emitDepth_{0};
};

} // namespace ac
