// main_vis.cpp
// - Solves the Dual, Otto, Diesel and Atkinson cycles from the built-in air-standard parameters
// - Renders the overlaid P-V chart off-screen (ImPlot) and saves it as a 300 DPI PNG
// - Prints the Atkinson performance report on stdout; diagnostics go to stderr

#include <array>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "ChartLayout.h"
#include "CycleParameters.h"
#include "CyclePerformance.h"
#include "CycleStates.h"
#include "ProcessCurves.h"

#include "png_writer.h"
#include "pv_chart_render.h"

static const char* kOutputPng = "Thermodynamic_Cycles_Comparison.png";

static int fail(const std::string& msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg.empty() ? "(null)" : msg.c_str());
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

int main() {
    const cyclecmp::CycleParameters params;

    const auto states = cyclecmp::solveAllCycles(params);
    std::array<cyclecmp::CycleTrace, cyclecmp::kNumCycles> traces;
    for (std::size_t i = 0; i < states.size(); ++i) {
        traces[i] = cyclecmp::CycleTrace::build(states[i], params.gamma);
    }

    const cyclecmp::ChartSpec chart = cyclecmp::buildComparisonChart(params, states, traces);

    cyclecmp::vis::RgbaImage image;
    std::string err;
    if (!cyclecmp::vis::renderChart(chart, cyclecmp::vis::RenderOptions{}, image, &err)) {
        return fail(err);
    }

    const cyclecmp::CycleStates& atkinson = states[static_cast<std::size_t>(cyclecmp::CycleKind::Atkinson)];
    const cyclecmp::CyclePerformance perf = cyclecmp::computePerformance(params, atkinson);
    std::cout << cyclecmp::formatAtkinsonReport(atkinson, perf);
    std::cout.flush();

    if (!cyclecmp::vis::writePng(kOutputPng, image, chart.output_dpi, &err)) {
        return fail(err);
    }
    std::fprintf(stderr, "Chart written to: %s (%dx%d, %.0f DPI)\n",
                 kOutputPng, image.width, image.height, chart.output_dpi);
    return 0;
}
