#pragma once
#include "ac/chart/Chart.hpp"
#include "ac/cursor/CursorController.hpp"
#include "ac/geom/Geometry.hpp"
#include "ac/layout/LabelLayout.hpp"
#include "ac/layout/LabelTransition.hpp"
#include "ac/path/CurveBuilder.hpp"
#include "ac/path/GridBuilder.hpp"
#include "ac/path/Path.hpp"
#include "ac/render/RenderTarget.hpp"
#include "ac/viewport/ScaleMapper.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace ac {

class TextMeasurer;

// Smooth line chart with axis labels and a tracking cursor.
//
// Owns the series, the derived geometry and the cursor state. Every visual
// change is pushed to the RenderTarget. The target and the measurer must
// outlive the chart. A completion the target runs after the chart is gone
// skips the label rebuild and only calls the caller's completion.
class LineChart : public Chart {
public:
  LineChart(const LineChartConfig& config, CursorLabelProvider labelProvider,
            RenderTarget& target, const TextMeasurer& measurer);
  LineChart(const LineChart&) = delete;
  LineChart& operator=(const LineChart&) = delete;

  const LineChartConfig& configuration() const override { return config_; }

  void updateChart(const DataSeries& points, bool animated,
                   std::function<void()> completion) override;

  SubscriptionId subscribe(CursorEventHandler handler) override;
  bool unsubscribe(SubscriptionId id) override;

  // Layout pass: new view bounds. Recomputes frame, grid, curve and label
  // positions without animating the labels.
  void setViewSize(double width, double height);

  // Pointer input, in view coordinates.
  void pointerBegan(const Point2& location);
  void pointerMoved(const Point2& location);
  void pointerEnded();
  void pointerCancelled() { pointerEnded(); }

  const DataSeries& series() const { return series_; }
  const Size2& viewSize() const { return viewSize_; }
  const Rect& chartFrame() const { return frame_; }

  // Curve (or singleton dot) most recently submitted for the graph layer.
  const Path& renderedPath() const { return path_; }
  bool scaleMapping(ScaleMapping& out) const;

  const Path& horizontalGridPath() const { return hGrid_; }
  const Path& verticalGridPath() const { return vGrid_; }

  const std::vector<AxisLabel>& xLabels() const { return xLabels_; }
  const std::vector<AxisLabel>& yLabels() const { return yLabels_; }

  // Transition submitted with the latest label rebuild; null when that
  // rebuild had nothing to cross-fade from.
  const LabelTransition* lastXTransition() const { return hasXTransition_ ? &xTransition_ : nullptr; }
  const LabelTransition* lastYTransition() const { return hasYTransition_ ? &yTransition_ : nullptr; }

  CursorState cursorState() const { return cursor_.state(); }
  const CursorVisuals& cursorVisuals() const { return cursor_.visuals(); }

  // Width reserved for y-labels and height reserved for x-labels.
  double gutterWidth() const;
  double bottomInset() const;

private:
  Rect computeChartFrame() const;
  bool relayoutFrame();
  void updateGrid();
  bool updateGraph(bool animated, std::function<void()> completion);
  void rebuildLabels();
  void placeLabels();

  LineChartConfig config_;
  RenderTarget& target_;
  const TextMeasurer& measurer_;

  ScaleMapper mapper_;
  CurveBuilder curves_;
  GridBuilder grid_;
  LabelLayout labels_;
  CursorController cursor_;
  CursorEventHub hub_;

  DataSeries series_;
  Size2 viewSize_;
  Rect frame_;
  bool animated_{false};

  bool hasMapping_{false};
  ScaleMapping mapping_;
  Path path_;
  Path hGrid_;
  Path vGrid_;

  std::vector<AxisLabel> xLabels_;
  std::vector<AxisLabel> yLabels_;
  LabelTransition xTransition_;
  LabelTransition yTransition_;
  bool hasXTransition_{false};
  bool hasYTransition_{false};

  // Checked by completions the target may run after destruction.
  std::shared_ptr<bool> alive_;
};

} // namespace ac
