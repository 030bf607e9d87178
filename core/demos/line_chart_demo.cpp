// Line chart demo
// Builds a chart from a synthetic daily series, plays an animated update,
// moves the cursor across the middle and writes the final frame as SVG.
//
// usage: line_chart_demo [out.svg] [font.ttf] [config.json]

#include "ac/chart/LineChart.hpp"
#include "ac/render/RenderTarget.hpp"
#include "ac/style/LineChartConfig.hpp"
#include "ac/text/FontMetrics.hpp"
#include "ac/text/TextMeasurer.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

// ---- Helpers ----

static std::string rgba(const float c[4]) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "rgba(%d,%d,%d,%.3f)",
                static_cast<int>(c[0] * 255.0f), static_cast<int>(c[1] * 255.0f),
                static_cast<int>(c[2] * 255.0f), static_cast<double>(c[3]));
  return buf;
}

static std::string svgPathData(const ac::Path& path) {
  std::ostringstream d;
  for (const auto& e : path.elements()) {
    switch (e.op) {
      case ac::PathOp::MoveTo:
        d << "M" << e.pts[0].x << " " << e.pts[0].y << " ";
        break;
      case ac::PathOp::LineTo:
        d << "L" << e.pts[0].x << " " << e.pts[0].y << " ";
        break;
      case ac::PathOp::QuadTo:
        d << "Q" << e.pts[0].x << " " << e.pts[0].y << " "
          << e.pts[1].x << " " << e.pts[1].y << " ";
        break;
      case ac::PathOp::CubicTo:
        d << "C" << e.pts[0].x << " " << e.pts[0].y << " "
          << e.pts[1].x << " " << e.pts[1].y << " "
          << e.pts[2].x << " " << e.pts[2].y << " ";
        break;
      case ac::PathOp::ArcTo: {
        // SVG cannot draw a full circle in one arc; split at the half.
        double mid = (e.startAngle + e.endAngle) * 0.5;
        double mx = e.pts[0].x + e.radius * std::cos(mid);
        double my = e.pts[0].y + e.radius * std::sin(mid);
        ac::Point2 end = e.endPoint();
        int sweep = e.clockwise ? 1 : 0;
        d << "A" << e.radius << " " << e.radius << " 0 0 " << sweep << " " << mx << " " << my << " "
          << "A" << e.radius << " " << e.radius << " 0 0 " << sweep << " " << end.x << " " << end.y << " ";
        break;
      }
      case ac::PathOp::Close:
        d << "Z ";
        break;
    }
  }
  return d.str();
}

// Keeps the latest state of every layer; animations complete on flush().
class SvgTarget : public ac::RenderTarget {
public:
  void submitPath(ac::ChartLayer layer, const ac::Path& path,
                  const ac::PathAnimation* animation,
                  std::function<void()> completion) override {
    paths_[static_cast<int>(layer)] = path;
    if (animation) {
      std::printf("  animate layer %d over %.2fs (%zu -> %zu elements)\n",
                  static_cast<int>(layer), animation->spec.duration,
                  animation->from.size(), path.size());
    }
    if (completion) pending_.push_back(std::move(completion));
  }

  void setLayerVisible(ac::ChartLayer layer, bool visible) override {
    visible_[static_cast<int>(layer)] = visible;
  }

  void submitLabels(bool vertical, const std::vector<ac::AxisLabel>& labels,
                    const ac::LabelTransition* transition) override {
    (vertical ? yLabels_ : xLabels_) = labels;
    if (transition) {
      std::printf("  %s labels: %zu -> %zu%s\n", vertical ? "y" : "x",
                  transition->outgoing.size(), transition->incoming.size(),
                  transition->expanding ? " (expanding)" : "");
    }
  }

  void submitCursor(const ac::CursorVisuals& visuals) override { cursor_ = visuals; }

  void flush() {
    std::vector<std::function<void()>> run;
    run.swap(pending_);
    for (auto& f : run) f();
  }

  bool write(const char* filename, const ac::LineChart& chart) const {
    const ac::LineChartConfig& cfg = chart.configuration();
    const ac::Rect frame = chart.chartFrame();
    const ac::Size2 view = chart.viewSize();

    std::ofstream out(filename);
    if (!out) {
      std::fprintf(stderr, "SvgTarget: cannot write %s\n", filename);
      return false;
    }

    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << view.width
        << "\" height=\"" << view.height << "\">\n";
    out << "<rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";
    out << "<g transform=\"translate(" << frame.x << "," << frame.y << ")\">\n";

    auto stroke = [&](ac::ChartLayer layer, const std::string& color, double width,
                      const char* extra) {
      int i = static_cast<int>(layer);
      if (!visible_[i] || paths_[i].empty()) return;
      out << "<path d=\"" << svgPathData(paths_[i]) << "\" fill=\"none\" stroke=\""
          << color << "\" stroke-width=\"" << width << "\" " << extra << "/>\n";
    };
    stroke(ac::ChartLayer::HorizontalGrid, rgba(cfg.horizontalGrid.color), cfg.horizontalGrid.lineWidth, "");
    stroke(ac::ChartLayer::VerticalGrid, rgba(cfg.verticalGrid.color), cfg.verticalGrid.lineWidth, "");
    stroke(ac::ChartLayer::Graph, rgba(cfg.tintColor), cfg.lineWidth, "stroke-linecap=\"round\"");

    if (cursor_.hoverVisible) {
      const ac::Rect& m = cursor_.hoverMask;
      out << "<clipPath id=\"hover\"><rect x=\"" << m.x << "\" y=\"" << m.y << "\" width=\""
          << m.width << "\" height=\"" << m.height << "\"/></clipPath>\n";
      stroke(ac::ChartLayer::Hover, rgba(cfg.hoverLineColor), cfg.lineWidth,
             "clip-path=\"url(#hover)\"");
    }
    out << "</g>\n";

    auto text = [&](const ac::AxisLabel& l, const ac::AxisLabelStyle& style) {
      out << "<text x=\"" << l.frame.x << "\" y=\"" << l.frame.maxY() << "\" font-size=\""
          << style.fontSize << "\" fill=\"" << rgba(style.color) << "\">" << l.text << "</text>\n";
    };
    for (const auto& l : yLabels_) text(l, cfg.verticalLabels);
    for (const auto& l : xLabels_) text(l, cfg.horizontalLabels);

    if (cursor_.lineVisible) {
      out << "<line x1=\"" << cursor_.lineStart.x << "\" y1=\"" << cursor_.lineStart.y
          << "\" x2=\"" << cursor_.lineEnd.x << "\" y2=\"" << cursor_.lineEnd.y
          << "\" stroke=\"" << rgba(cfg.cursorColor) << "\" stroke-dasharray=\"4 2\"/>\n";
    }
    if (cursor_.dotVisible) {
      out << "<circle cx=\"" << cursor_.dotCenter.x << "\" cy=\"" << cursor_.dotCenter.y
          << "\" r=\"" << cursor_.dotSize * 0.5 << "\" fill=\"" << rgba(cfg.dot.color)
          << "\" stroke=\"" << rgba(cfg.dot.strokeColor) << "\" stroke-width=\""
          << cfg.dot.strokeWidth << "\"/>\n";
    }
    if (cursor_.tooltipVisible) {
      const ac::Rect& t = cursor_.tooltipFrame;
      out << "<rect x=\"" << t.x << "\" y=\"" << t.y << "\" width=\"" << t.width
          << "\" height=\"" << t.height << "\" rx=\"" << cursor_.tooltipCornerRadius
          << "\" fill=\"" << rgba(cfg.cursorLabel.backgroundColor) << "\"/>\n";
      out << "<text x=\"" << t.midX() << "\" y=\"" << t.maxY() - 3.0
          << "\" text-anchor=\"middle\" font-size=\"" << cfg.cursorLabel.fontSize
          << "\" fill=\"" << rgba(cfg.cursorLabel.foregroundColor) << "\">"
          << cursor_.tooltipText << "</text>\n";
    }
    out << "</svg>\n";
    return true;
  }

private:
  ac::Path paths_[4];
  bool visible_[4] = {true, true, true, true};
  std::vector<ac::AxisLabel> xLabels_;
  std::vector<ac::AxisLabel> yLabels_;
  ac::CursorVisuals cursor_;
  std::vector<std::function<void()>> pending_;
};

static bool readFile(const char* path, std::string& out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

static ac::DataSeries makeSeries(int count, double phase) {
  ac::DataSeries s;
  double ts = 1700000000.0;
  for (int i = 0; i < count; i++) {
    double v = 120.0 + 40.0 * std::sin(0.45 * i + phase) + 3.0 * i;
    s.push_back(ac::ChartPoint{v, ts});
    ts += 86400.0;
  }
  return s;
}

int main(int argc, char** argv) {
  const char* outPath = argc > 1 ? argv[1] : "line_chart.svg";

  ac::LineChartConfig cfg = ac::defaultLineChartConfig();
  if (argc > 3) {
    std::string json;
    if (!readFile(argv[3], json)) {
      std::fprintf(stderr, "cannot read %s\n", argv[3]);
      return 1;
    }
    if (!ac::loadLineChartConfig(json, cfg)) return 1;
    std::printf("Config loaded: %s\n", cfg.name.c_str());
  }

  ac::FixedAdvanceMeasurer fallback;
  ac::FontMetrics font;
  const ac::TextMeasurer* measurer = &fallback;
  if (argc > 2 && font.loadFontFile(argv[2])) {
    measurer = &font;
    std::printf("Font loaded\n");
  }

  SvgTarget target;
  ac::LineChart chart(cfg, [](const ac::ChartPoint& p) {
                        return ac::LabelLayout::formatValue(p.value);
                      },
                      target, *measurer);
  chart.subscribe([](const ac::CursorEvent& e) {
    switch (e.type) {
      case ac::CursorEventType::Begin: std::printf("  cursor begin\n"); break;
      case ac::CursorEventType::Moved: std::printf("  cursor at %.1f\n", e.point.value); break;
      case ac::CursorEventType::EndMoved: std::printf("  cursor end\n"); break;
    }
  });

  chart.setViewSize(640, 320);
  chart.updateChart(makeSeries(8, 0.0), false, [] { std::printf("Initial series shown\n"); });
  chart.updateChart(makeSeries(14, 0.7), true, [] { std::printf("Update settled\n"); });
  target.flush();

  ac::Rect frame = chart.chartFrame();
  chart.pointerBegan({frame.midX(), frame.midY()});
  chart.pointerMoved({frame.midX(), frame.midY()});

  if (!target.write(outPath, chart)) return 1;
  std::printf("Wrote %s (%.0fx%.0f)\n", outPath, chart.viewSize().width, chart.viewSize().height);
  return 0;
}
