#include "ac/cursor/CursorController.hpp"
#include "ac/text/TextMeasurer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ac {

CursorController::CursorController(const LineChartConfig& config,
                                   CursorLabelProvider labelProvider,
                                   const TextMeasurer& measurer)
  : config_(config), labelProvider_(std::move(labelProvider)), measurer_(measurer) {}

void CursorController::begin(CursorEventHub& hub) {
  if (state_ == CursorState::Active) return;
  state_ = CursorState::Active;
  hub.emit(CursorEvent::begin());
}

void CursorController::move(const Point2& location, const DataSeries& series,
                            const Path& path, const Rect& chartFrame,
                            CursorEventHub& hub) {
  if (state_ != CursorState::Active) return;
  if (series.empty()) return;

  if (series.size() == 1) {
    moveSingle(series, chartFrame, hub);
  } else {
    moveMulti(location, series, path, chartFrame, hub);
  }
}

void CursorController::moveSingle(const DataSeries& series, const Rect& chartFrame,
                                  CursorEventHub& hub) {
  double centerX = chartFrame.minX() + chartFrame.width * 0.5;

  // Marker uses its own +/-10% band, so it always lands on the frame's
  // vertical middle.
  double value = series[0].value;
  double yMin = value - value * 0.1;
  double yMax = value + value * 0.1;
  if (std::fabs(yMax - yMin) < 1e-9) {
    yMin = value - 1.0;
    yMax = value + 1.0;
  }
  double yScale = chartFrame.height / (yMax - yMin);
  double y = chartFrame.maxY() - (value - yMin) * yScale;

  visuals_.lineVisible = config_.showsCursor;
  visuals_.lineStart = Point2{centerX, chartFrame.minY()};
  visuals_.lineEnd = Point2{centerX, chartFrame.maxY()};
  placeDot(Point2{centerX, y});
  visuals_.hoverVisible = false;

  hasIndex_ = true;
  index_ = 0;
  if (showTooltip(series[0], centerX, nullptr)) {
    hub.emit(CursorEvent::moved(series[0]));
  }
}

void CursorController::moveMulti(const Point2& location, const DataSeries& series,
                                 const Path& path, const Rect& chartFrame,
                                 CursorEventHub& hub) {
  double xOffset = std::max(chartFrame.minX(), std::min(location.x, chartFrame.maxX()));
  double relativeX = xOffset - chartFrame.minX();

  visuals_.lineVisible = config_.showsCursor;
  visuals_.lineStart = Point2{xOffset, chartFrame.minY()};
  visuals_.lineEnd = Point2{xOffset, chartFrame.maxY()};

  visuals_.hoverVisible = true;
  visuals_.hoverMask = Rect{relativeX, 0.0, chartFrame.width - relativeX, chartFrame.height};

  Point2 hit;
  if (findCurveIntersection(path, relativeX, intersect_, hit)) {
    placeDot(Point2{xOffset, hit.y + chartFrame.minY()});
  }

  // Tooltip content comes from the coarse even-spacing index, not from
  // the curve hit above.
  std::size_t idx = nearestPointIndex(relativeX, chartFrame.width, series.size());
  hasIndex_ = true;
  index_ = idx;
  if (showTooltip(series[idx], xOffset, &chartFrame)) {
    hub.emit(CursorEvent::moved(series[idx]));
  }
}

void CursorController::placeDot(const Point2& center) {
  visuals_.dotVisible = true;
  visuals_.dotCenter = center;
  visuals_.dotSize = config_.dot.size;
}

bool CursorController::showTooltip(const ChartPoint& point, double centerX,
                                   const Rect* clampFrame) {
  std::string text = labelProvider_ ? labelProvider_(point) : std::string();
  if (text.empty()) {
    visuals_.tooltipVisible = false;
    return false;
  }

  Size2 size = measurer_.measure(text, config_.cursorLabel.fontSize);
  double width = size.width + 2.0 * config_.tooltipHorizontalInset;
  double x = centerX - width * 0.5;
  if (clampFrame) {
    double minX = clampFrame->minX();
    double maxX = clampFrame->maxX() - width;
    x = std::min(maxX, std::max(minX, x));
  }

  visuals_.tooltipVisible = true;
  visuals_.tooltipText = std::move(text);
  visuals_.tooltipFrame = Rect{x, 0.0, width, size.height};
  visuals_.tooltipCornerRadius = size.height * 0.5;
  return true;
}

void CursorController::end(CursorEventHub& hub) {
  if (state_ != CursorState::Active) return;
  state_ = CursorState::Idle;
  hideAll();
  hub.emit(CursorEvent::endMoved());
}

void CursorController::hideAll() {
  visuals_.lineVisible = false;
  visuals_.dotVisible = false;
  visuals_.hoverVisible = false;
  visuals_.tooltipVisible = false;
}

bool CursorController::lastIndex(std::size_t& out) const {
  if (!hasIndex_) return false;
  out = index_;
  return true;
}

} // namespace ac
