#pragma once
#include <cstddef>
#include <functional>
#include <vector>

namespace ac {

// One sample of the series. Timestamp is seconds since the Unix epoch.
struct ChartPoint {
  double value{0};
  double timestamp{0};
};

inline bool operator==(const ChartPoint& a, const ChartPoint& b) {
  return a.value == b.value && a.timestamp == b.timestamp;
}
inline bool operator!=(const ChartPoint& a, const ChartPoint& b) { return !(a == b); }

// Chronological, replaced wholesale on every update.
using DataSeries = std::vector<ChartPoint>;

} // namespace ac

namespace std {

template <>
struct hash<ac::ChartPoint> {
  std::size_t operator()(const ac::ChartPoint& p) const noexcept {
    std::size_t h = std::hash<double>{}(p.value);
    h ^= std::hash<double>{}(p.timestamp) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
    return h;
  }
};

} // namespace std
