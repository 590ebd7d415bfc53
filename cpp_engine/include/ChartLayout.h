#pragma once

// ChartLayout.h
//
// Render-ready description of the P-V comparison chart.
//
//   - No ImGui / ImPlot / OpenGL dependencies.
//   - Deterministic: a pure function of the parameters and solved cycles.
//   - vis/ draws a ChartSpec as-is; all styling decisions live here.
//
// Sizes are given in logical pixels of a 96 DPI screen figure and scaled by
// ChartSpec::scale() for the output DPI.

#include <array>
#include <string>
#include <vector>

#include "CycleParameters.h"
#include "CycleStates.h"
#include "ProcessCurves.h"

namespace cyclecmp {

struct ColorRGBA {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;
};

enum class LineStyle : int {
    Solid = 0,
    Dashed = 1,
    DashDot = 2,
    Dotted = 3,
};

struct ChartViewport {
    double V_min = 0.0;
    double V_max = 1.1;
    double P_min = 0.0;
    double P_max = 6000.0;
};

struct ChartSeries {
    std::string label;
    CycleKind kind = CycleKind::Dual;
    ColorRGBA color{};
    LineStyle style = LineStyle::Solid;
    float line_weight_px = 2.0f;

    // Closed trace, ready to plot (dash gaps are NaN separators).
    std::vector<double> line_V;
    std::vector<double> line_P;

    // Filled markers at the state points.
    std::vector<double> marker_V;
    std::vector<double> marker_P;
    float marker_size_px = 4.0f; // radius, logical px
};

struct ChartSpec {
    static constexpr double kScreenDpi = 96.0;

    std::string title;
    std::string x_label;
    std::string y_label;
    ChartViewport viewport{};

    // Figure size in logical (96 DPI) pixels and output resolution.
    int figure_w_px = 900;
    int figure_h_px = 650;
    double output_dpi = 300.0;

    float title_font_px = 14.0f;
    float label_font_px = 12.0f;
    bool show_grid = true;

    std::vector<ChartSeries> series;

    double scale() const { return output_dpi / kScreenDpi; }
    int outputWidth() const;
    int outputHeight() const;
};

// On/off lengths in logical pixels for a line style; empty for Solid.
std::vector<double> dashPattern(LineStyle style);

// Split a polyline into dashes. Lengths are measured on screen: x is mapped
// from the viewport to plot_w_px and y to plot_h_px. Dashes are separated by
// a NaN pair. An empty pattern, a degenerate viewport, or any non-positive
// pattern entry returns the polyline unchanged.
void applyDashPattern(const std::vector<double>& xs,
                      const std::vector<double>& ys,
                      const std::vector<double>& pattern,
                      const ChartViewport& viewport,
                      double plot_w_px,
                      double plot_h_px,
                      std::vector<double>& out_xs,
                      std::vector<double>& out_ys);

// Four overlaid cycles: Dual (blue solid), Otto (red dashed),
// Diesel (green dash-dot), Atkinson (magenta dotted).
ChartSpec buildComparisonChart(const CycleParameters& p,
                               const std::array<CycleStates, kNumCycles>& states,
                               const std::array<CycleTrace, kNumCycles>& traces);

} // namespace cyclecmp
