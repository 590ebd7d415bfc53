#include "ChartLayout.h"

#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>
#include <utility>

namespace cyclecmp {

namespace {

// Approximate plot-area size inside the 900x650 figure, used for dash lengths.
constexpr double kPlotAreaW_px = 700.0;
constexpr double kPlotAreaH_px = 500.0;

constexpr float kLineWeight_px = 2.0f;
constexpr float kMarkerSize_px = 4.0f; // radius; 6 pt = 8 px diameter at 96 DPI

static inline ColorRGBA rgb(float r, float g, float b) {
    ColorRGBA c;
    c.r = r;
    c.g = g;
    c.b = b;
    c.a = 1.0f;
    return c;
}

struct SeriesStyle {
    const char* label;
    ColorRGBA color;
    LineStyle style;
};

static SeriesStyle styleFor(CycleKind kind) {
    switch (kind) {
    case CycleKind::Dual:     return {"Dual Cycle", rgb(0.0f, 0.0f, 1.0f), LineStyle::Solid};
    case CycleKind::Otto:     return {"Otto Cycle", rgb(1.0f, 0.0f, 0.0f), LineStyle::Dashed};
    case CycleKind::Diesel:   return {"Diesel Cycle", rgb(0.0f, 1.0f, 0.0f), LineStyle::DashDot};
    case CycleKind::Atkinson: return {"Atkinson Cycle", rgb(1.0f, 0.0f, 1.0f), LineStyle::Dotted};
    }
    return {"Cycle", rgb(0.0f, 0.0f, 0.0f), LineStyle::Solid};
}

static inline void pushBreak(std::vector<double>& xs, std::vector<double>& ys) {
    xs.push_back(std::numeric_limits<double>::quiet_NaN());
    ys.push_back(std::numeric_limits<double>::quiet_NaN());
}

} // namespace

int ChartSpec::outputWidth() const {
    return static_cast<int>(std::lround(figure_w_px * scale()));
}

int ChartSpec::outputHeight() const {
    return static_cast<int>(std::lround(figure_h_px * scale()));
}

std::vector<double> dashPattern(LineStyle style) {
    switch (style) {
    case LineStyle::Solid:   return {};
    case LineStyle::Dashed:  return {10.0, 6.0};
    case LineStyle::DashDot: return {10.0, 4.0, 2.0, 4.0};
    case LineStyle::Dotted:  return {2.0, 4.0};
    }
    return {};
}

void applyDashPattern(const std::vector<double>& xs,
                      const std::vector<double>& ys,
                      const std::vector<double>& pattern,
                      const ChartViewport& viewport,
                      double plot_w_px,
                      double plot_h_px,
                      std::vector<double>& out_xs,
                      std::vector<double>& out_ys) {
    out_xs.clear();
    out_ys.clear();

    const std::size_t n = (xs.size() < ys.size()) ? xs.size() : ys.size();
    const double x_span = viewport.V_max - viewport.V_min;
    const double y_span = viewport.P_max - viewport.P_min;

    bool usable = !pattern.empty() && x_span > 0.0 && y_span > 0.0 && plot_w_px > 0.0 && plot_h_px > 0.0;
    for (double len : pattern) {
        if (!(std::isfinite(len) && len > 0.0)) usable = false;
    }
    if (!usable || n < 2) {
        out_xs.assign(xs.begin(), xs.begin() + static_cast<std::ptrdiff_t>(n));
        out_ys.assign(ys.begin(), ys.begin() + static_cast<std::ptrdiff_t>(n));
        return;
    }

    const double sx = plot_w_px / x_span;
    const double sy = plot_h_px / y_span;

    std::size_t idx = 0;              // current pattern element; even = dash, odd = gap
    double remaining = pattern[0];    // screen length left in the current element

    out_xs.push_back(xs[0]);
    out_ys.push_back(ys[0]);

    for (std::size_t i = 1; i < n; ++i) {
        const double x0 = xs[i - 1];
        const double y0 = ys[i - 1];
        const double x1 = xs[i];
        const double y1 = ys[i];

        const double dx = (x1 - x0) * sx;
        const double dy = (y1 - y0) * sy;
        const double L = std::sqrt(dx * dx + dy * dy);
        if (!(L > 0.0)) {
            continue;
        }

        double t = 0.0; // screen length consumed along this segment
        while (L - t > remaining) {
            t += remaining;
            const double f = t / L;
            const double xb = x0 + (x1 - x0) * f;
            const double yb = y0 + (y1 - y0) * f;
            if (idx % 2 == 0) {
                // Dash ends here.
                out_xs.push_back(xb);
                out_ys.push_back(yb);
                pushBreak(out_xs, out_ys);
            } else {
                // Gap ends, next dash starts here.
                out_xs.push_back(xb);
                out_ys.push_back(yb);
            }
            idx = (idx + 1) % pattern.size();
            remaining = pattern[idx];
        }
        remaining -= (L - t);

        if (idx % 2 == 0) {
            out_xs.push_back(x1);
            out_ys.push_back(y1);
        }
    }
}

ChartSpec buildComparisonChart(const CycleParameters& p,
                               const std::array<CycleStates, kNumCycles>& states,
                               const std::array<CycleTrace, kNumCycles>& traces) {
    ChartSpec spec;

    std::ostringstream title;
    title << "P-V Diagram Comparison (r_c=" << p.compression_ratio << ")";
    spec.title = title.str();
    spec.x_label = "Volume (m^3/kg)";
    spec.y_label = "Pressure (kPa)";

    spec.series.reserve(kNumCycles);
    for (std::size_t i = 0; i < states.size(); ++i) {
        const CycleStates& cs = states[i];
        const CycleTrace& trace = traces[i];
        if (!cs.valid || trace.empty()) {
            continue;
        }

        const SeriesStyle st = styleFor(cs.kind);
        ChartSeries s;
        s.label = st.label;
        s.kind = cs.kind;
        s.color = st.color;
        s.style = st.style;
        s.line_weight_px = kLineWeight_px;
        s.marker_size_px = kMarkerSize_px;

        applyDashPattern(trace.volumes(), trace.pressures(), dashPattern(st.style),
                         spec.viewport, kPlotAreaW_px, kPlotAreaH_px,
                         s.line_V, s.line_P);

        s.marker_V.reserve(cs.points.size());
        s.marker_P.reserve(cs.points.size());
        for (const auto& pt : cs.points) {
            s.marker_V.push_back(pt.V_m3_per_kg);
            s.marker_P.push_back(pt.P_kPa);
        }

        spec.series.push_back(std::move(s));
    }
    return spec;
}

} // namespace cyclecmp
