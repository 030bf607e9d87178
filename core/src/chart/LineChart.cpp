#include "ac/chart/LineChart.hpp"
#include "ac/text/TextMeasurer.hpp"

#include <utility>

namespace ac {

LineChart::LineChart(const LineChartConfig& config, CursorLabelProvider labelProvider,
                     RenderTarget& target, const TextMeasurer& measurer)
  : config_(config),
    target_(target),
    measurer_(measurer),
    cursor_(config, std::move(labelProvider), measurer),
    alive_(std::make_shared<bool>(true)) {
  labels_.setConfig(config_);

  GridConfig gc;
  gc.horizontalLines = config_.verticalDivisions;
  gc.verticalSpacing = config_.verticalGridSpacing;
  grid_.setConfig(gc);

  target_.setLayerVisible(ChartLayer::HorizontalGrid, config_.showsHorizontalGridLines);
  target_.setLayerVisible(ChartLayer::VerticalGrid, config_.showsVerticalGridLines);
}

SubscriptionId LineChart::subscribe(CursorEventHandler handler) {
  return hub_.subscribe(std::move(handler));
}

bool LineChart::unsubscribe(SubscriptionId id) {
  return hub_.unsubscribe(id);
}

void LineChart::updateChart(const DataSeries& points, bool animated,
                            std::function<void()> completion) {
  series_ = points;
  animated_ = animated;

  if (cursor_.state() == CursorState::Active) {
    cursor_.end(hub_);
    target_.submitCursor(cursor_.visuals());
  }

  if (relayoutFrame()) updateGrid();

  if (!animated) {
    updateGraph(false, nullptr);
    rebuildLabels();
    if (completion) completion();
    return;
  }

  std::weak_ptr<bool> alive = alive_;
  auto settle = [this, alive, completion]() {
    if (!alive.expired()) rebuildLabels();
    if (completion) completion();
  };
  if (!updateGraph(true, settle)) settle();
}

void LineChart::setViewSize(double width, double height) {
  viewSize_ = Size2{width, height};
  frame_ = computeChartFrame();
  updateGrid();
  updateGraph(animated_, nullptr);
  placeLabels();
  target_.submitLabels(true, yLabels_, nullptr);
  target_.submitLabels(false, xLabels_, nullptr);
}

void LineChart::pointerBegan(const Point2& location) {
  (void)location;  // position is resolved on the first move
  cursor_.begin(hub_);
}

void LineChart::pointerMoved(const Point2& location) {
  if (cursor_.state() != CursorState::Active) return;
  if (series_.empty()) return;

  cursor_.move(location, series_, path_, frame_, hub_);
  if (cursor_.visuals().hoverVisible) {
    target_.submitPath(ChartLayer::Hover, path_, nullptr, nullptr);
  }
  target_.submitCursor(cursor_.visuals());
}

void LineChart::pointerEnded() {
  if (cursor_.state() != CursorState::Active) return;
  cursor_.end(hub_);
  target_.submitCursor(cursor_.visuals());
}

bool LineChart::scaleMapping(ScaleMapping& out) const {
  if (!hasMapping_) return false;
  out = mapping_;
  return true;
}

double LineChart::gutterWidth() const {
  return LabelLayout::verticalLabelsWidth(series_);
}

double LineChart::bottomInset() const {
  double labelHeight = xLabels_.empty() ? 0.0 : xLabels_.front().textSize.height;
  return labelHeight + config_.horizontalLabelsToTopPadding;
}

Rect LineChart::computeChartFrame() const {
  const EdgeInsets& pad = config_.padding;
  Rect bounds{0.0, 0.0, viewSize_.width, viewSize_.height};
  return bounds.inset(EdgeInsets{pad.top, pad.left + gutterWidth(),
                                 pad.bottom + bottomInset(), pad.right});
}

bool LineChart::relayoutFrame() {
  Rect f = computeChartFrame();
  if (f == frame_) return false;
  frame_ = f;
  return true;
}

void LineChart::updateGrid() {
  if (frame_.isEmpty()) {
    hGrid_.clear();
    vGrid_.clear();
  } else {
    hGrid_ = grid_.horizontalLines(frame_.width, frame_.height);
    vGrid_ = grid_.verticalLines(frame_.width, frame_.height);
  }
  target_.submitPath(ChartLayer::HorizontalGrid, hGrid_, nullptr, nullptr);
  target_.submitPath(ChartLayer::VerticalGrid, vGrid_, nullptr, nullptr);
}

// Returns true when `completion` was handed to the render target.
bool LineChart::updateGraph(bool animated, std::function<void()> completion) {
  if (series_.empty() || frame_.isEmpty()) return false;

  ScaleMapping m;
  if (!mapper_.compute(series_, frame_.width, frame_.height, config_.lineWidth, m)) {
    return false;
  }
  mapping_ = m;
  hasMapping_ = true;

  Path next;
  if (m.singlePoint) {
    next = curves_.singlePointDot(m.screenPoint(0, series_[0].value),
                                  frame_.width, frame_.height);
  } else {
    next = curves_.smoothCurve(ScaleMapper::mapSeries(series_, m), m.clampRect);
  }

  // The dot appears without animation.
  if (!animated || m.singlePoint) {
    path_ = std::move(next);
    target_.submitPath(ChartLayer::Graph, path_, nullptr, nullptr);
    return false;
  }

  PathAnimation anim;
  anim.from = path_.empty() ? next : path_;
  anim.spec.duration = config_.animationDuration;
  anim.spec.curve = EasingCurve::EaseInOut;
  path_ = std::move(next);
  target_.submitPath(ChartLayer::Graph, path_, &anim, std::move(completion));
  return true;
}

void LineChart::rebuildLabels() {
  // An empty series keeps the previous y scale.
  bool rebuildY = !series_.empty();

  std::vector<AxisLabel> oldY;
  if (rebuildY) {
    oldY = std::move(yLabels_);
    yLabels_ = labels_.buildYLabels(series_, measurer_);
  }
  std::vector<AxisLabel> oldX = std::move(xLabels_);
  xLabels_ = labels_.buildXLabels(series_, viewSize_.width, measurer_);

  // The x-label band and the gutter may have changed size.
  if (relayoutFrame()) {
    updateGrid();
    updateGraph(false, nullptr);
  }
  placeLabels();

  AnimationSpec spec;
  spec.duration = config_.animationDuration;
  spec.curve = EasingCurve::EaseInOut;

  if (rebuildY) {
    hasYTransition_ = !oldY.empty();
    if (hasYTransition_) {
      yTransition_ = makeLabelTransition(std::move(oldY), yLabels_, true, spec);
    }
    target_.submitLabels(true, yLabels_, hasYTransition_ ? &yTransition_ : nullptr);
  } else {
    hasYTransition_ = false;
    target_.submitLabels(true, yLabels_, nullptr);
  }

  hasXTransition_ = !oldX.empty();
  if (hasXTransition_) {
    xTransition_ = makeLabelTransition(std::move(oldX), xLabels_, false, spec);
  }
  target_.submitLabels(false, xLabels_, hasXTransition_ ? &xTransition_ : nullptr);
}

void LineChart::placeLabels() {
  labels_.placeXLabels(xLabels_, viewSize_, gutterWidth());
  labels_.placeYLabels(yLabels_, viewSize_, bottomInset());
}

} // namespace ac
