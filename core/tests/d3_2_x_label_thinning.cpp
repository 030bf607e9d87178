// D3.2 - X-axis label thinning (pure C++)

#include "ac/layout/LabelLayout.hpp"
#include "ac/text/TextMeasurer.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool sameIndices(const std::vector<std::size_t>& got,
                        const std::vector<std::size_t>& want) {
  return got == want;
}

int main() {
  // --- Test 1: everything fits ---
  {
    std::vector<double> widths(10, 50.0);
    auto idx = ac::LabelLayout::thinLabels(widths, 1000.0);
    requireTrue(idx.size() == 10, "all kept");
    idx = ac::LabelLayout::thinLabels(widths, 500.0);
    requireTrue(idx.size() == 10, "exact fit keeps all");
    std::printf("  Test 1 (fits) PASS\n");
  }

  // --- Test 2: stepping keeps first and last ---
  {
    std::vector<double> widths(10, 50.0);
    requireTrue(sameIndices(ac::LabelLayout::thinLabels(widths, 200.0), {0, 3, 6, 9}),
                "avail 200: step 3");
    requireTrue(sameIndices(ac::LabelLayout::thinLabels(widths, 400.0), {0, 2, 4, 6, 8, 9}),
                "avail 400: step floored at 2");
    requireTrue(sameIndices(ac::LabelLayout::thinLabels(widths, 0.0), {0, 9}),
                "no room: first and last");
    std::printf("  Test 2 (stepping) PASS\n");
  }

  // --- Test 3: tiny inputs ---
  {
    requireTrue(ac::LabelLayout::thinLabels({}, 100.0).empty(), "empty");
    requireTrue(sameIndices(ac::LabelLayout::thinLabels({500.0}, 100.0), {0}),
                "one oversized label kept");
    requireTrue(sameIndices(ac::LabelLayout::thinLabels({80.0, 80.0}, 100.0), {0, 1}),
                "two labels: both ends");
    std::printf("  Test 3 (tiny inputs) PASS\n");
  }

  // --- Test 4: buildXLabels against the view width ---
  {
    ac::LineChartConfig cfg = ac::plainLineChartConfig();
    cfg.dateFormat = "%Y";
    cfg.dateUseUTC = true;
    ac::LabelLayout layout;
    layout.setConfig(cfg);
    ac::FixedAdvanceMeasurer measurer;

    ac::DataSeries series;
    for (int i = 0; i < 10; i++) {
      series.push_back(ac::ChartPoint{10.0 + i, 1700000000.0 + 86400.0 * i});
    }

    // each label "2023" = 31.2 px + 20 spacing; available = width - 20 - 1.5 * 40
    auto wide = layout.buildXLabels(series, 600.0, measurer);
    requireTrue(wide.size() == 10, "600 px keeps all");
    requireTrue(wide[0].text == "2023", "formatted with the date pattern");
    requireTrue(!wide[0].isVertical, "horizontal");

    auto narrow = layout.buildXLabels(series, 280.0, measurer);
    requireTrue(narrow.size() == 4, "280 px keeps 4");
    requireTrue(narrow[0].sourceIndex == 0, "first");
    requireTrue(narrow[1].sourceIndex == 4, "step 4");
    requireTrue(narrow[2].sourceIndex == 8, "step 8");
    requireTrue(narrow[3].sourceIndex == 9, "last");

    requireTrue(layout.buildXLabels(ac::DataSeries{}, 600.0, measurer).empty(), "empty series");
    std::printf("  Test 4 (buildXLabels) PASS\n");
  }

  std::printf("D3.2 x label thinning: ALL PASS\n");
  return 0;
}
