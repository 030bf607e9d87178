#pragma once
#include "ac/data/ChartPoint.hpp"
#include "ac/data/CursorEventHub.hpp"
#include "ac/style/LineChartConfig.hpp"

#include <functional>

namespace ac {

// Capability shared by every chart kind.
class Chart {
public:
  virtual ~Chart() = default;

  virtual const LineChartConfig& configuration() const = 0;

  // Replace the displayed series. `completion` runs once the change has
  // settled: after the animation and the label rebuild when animated,
  // before returning otherwise.
  virtual void updateChart(const DataSeries& points, bool animated,
                           std::function<void()> completion) = 0;

  virtual SubscriptionId subscribe(CursorEventHandler handler) = 0;
  virtual bool unsubscribe(SubscriptionId id) = 0;
};

} // namespace ac
