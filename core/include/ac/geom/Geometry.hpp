#pragma once
#include <algorithm>

namespace ac {

struct Point2 {
  double x{0}, y{0};
};

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

struct Size2 {
  double width{0}, height{0};
};

struct EdgeInsets {
  double top{0}, left{0}, bottom{0}, right{0};
};

// Axis-aligned rectangle, origin at top-left, y grows downward.
struct Rect {
  double x{0}, y{0}, width{0}, height{0};

  double minX() const { return x; }
  double minY() const { return y; }
  double maxX() const { return x + width; }
  double maxY() const { return y + height; }
  double midX() const { return x + width * 0.5; }
  double midY() const { return y + height * 0.5; }
  bool isEmpty() const { return width <= 0.0 || height <= 0.0; }

  // Shrinks by dx on left/right and dy on top/bottom. Negative values grow.
  Rect insetBy(double dx, double dy) const {
    return Rect{x + dx, y + dy, width - 2.0 * dx, height - 2.0 * dy};
  }

  Rect inset(const EdgeInsets& e) const {
    return Rect{x + e.left, y + e.top,
                width - e.left - e.right, height - e.top - e.bottom};
  }
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

// Component-wise clamp into r. Only the point is constrained, never the
// curve that passes through it.
inline Point2 clampPoint(const Point2& p, const Rect& r) {
  return Point2{std::min(std::max(p.x, r.minX()), r.maxX()),
                std::min(std::max(p.y, r.minY()), r.maxY())};
}

inline Point2 lerpPoint(const Point2& a, const Point2& b, double t) {
  return Point2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

} // namespace ac
