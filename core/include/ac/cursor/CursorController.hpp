#pragma once
#include "ac/cursor/CurveIntersect.hpp"
#include "ac/data/ChartPoint.hpp"
#include "ac/data/CursorEventHub.hpp"
#include "ac/geom/Geometry.hpp"
#include "ac/path/Path.hpp"
#include "ac/style/LineChartConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace ac {

class TextMeasurer;

// Tooltip text for a resolved point. An empty string hides the tooltip and
// suppresses the Moved event; the marker still follows the pointer.
using CursorLabelProvider = std::function<std::string(const ChartPoint&)>;

// Pointer interaction: Idle -> (down) Active -> (move) Active -> (up) Idle
enum class CursorState : std::uint8_t {
  Idle = 0,
  Active
};

// Everything the render target needs to draw the cursor overlay.
// Positions are in view coordinates unless noted.
struct CursorVisuals {
  bool lineVisible{false};
  Point2 lineStart, lineEnd;       // dashed vertical line

  bool dotVisible{false};
  Point2 dotCenter;
  double dotSize{0};

  bool hoverVisible{false};
  Rect hoverMask;                  // chart-frame local; hover stroke shows inside

  bool tooltipVisible{false};
  std::string tooltipText;
  Rect tooltipFrame;
  double tooltipCornerRadius{0};
};

class CursorController {
public:
  CursorController(const LineChartConfig& config, CursorLabelProvider labelProvider,
                   const TextMeasurer& measurer);

  void setIntersectConfig(const IntersectConfig& cfg) { intersect_ = cfg; }

  // Pointer down. Emits Begin; ignored while already active.
  void begin(CursorEventHub& hub);

  // Pointer move at `location` (view coordinates). Resolves the marker on
  // `path` (chart-frame local) and the nearest data point of `series`.
  // Ignored while idle or when the series is empty.
  void move(const Point2& location, const DataSeries& series, const Path& path,
            const Rect& chartFrame, CursorEventHub& hub);

  // Pointer up or cancel. Hides all visuals and emits EndMoved.
  void end(CursorEventHub& hub);

  CursorState state() const { return state_; }
  const CursorVisuals& visuals() const { return visuals_; }

  // Index used for the tooltip on the last move; false before any move.
  bool lastIndex(std::size_t& out) const;

private:
  void moveSingle(const DataSeries& series, const Rect& chartFrame, CursorEventHub& hub);
  void moveMulti(const Point2& location, const DataSeries& series, const Path& path,
                 const Rect& chartFrame, CursorEventHub& hub);
  void placeDot(const Point2& center);
  bool showTooltip(const ChartPoint& point, double centerX, const Rect* clampFrame);
  void hideAll();

  LineChartConfig config_;
  CursorLabelProvider labelProvider_;
  const TextMeasurer& measurer_;
  IntersectConfig intersect_;

  CursorState state_{CursorState::Idle};
  CursorVisuals visuals_;
  bool hasIndex_{false};
  std::size_t index_{0};
};

} // namespace ac
