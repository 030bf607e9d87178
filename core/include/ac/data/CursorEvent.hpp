#pragma once
#include "ac/data/ChartPoint.hpp"
#include <cstdint>

namespace ac {

enum class CursorEventType : std::uint8_t {
  Begin = 0,
  Moved,
  EndMoved
};

// Tagged event; `point` is meaningful only for Moved.
struct CursorEvent {
  CursorEventType type{CursorEventType::Begin};
  ChartPoint point;

  static CursorEvent begin() { return CursorEvent{CursorEventType::Begin, {}}; }
  static CursorEvent moved(const ChartPoint& p) { return CursorEvent{CursorEventType::Moved, p}; }
  static CursorEvent endMoved() { return CursorEvent{CursorEventType::EndMoved, {}}; }
};

inline bool operator==(const CursorEvent& a, const CursorEvent& b) {
  if (a.type != b.type) return false;
  if (a.type == CursorEventType::Moved) return a.point == b.point;
  return true;
}
inline bool operator!=(const CursorEvent& a, const CursorEvent& b) { return !(a == b); }

} // namespace ac
