#pragma once

// vis/pv_chart_render.h
//
// Off-screen ImPlot rendering of a ChartSpec: hidden GLFW window for the GL
// context, framebuffer object at the output resolution, pixels read back.

#include <string>

#include "ChartLayout.h"
#include "png_writer.h"

namespace cyclecmp {
namespace vis {

struct RenderOptions {
    // ImPlot sizes legend/axes from the previous frame; the last frame is captured.
    int frames = 3;
    // Print GL vendor/renderer/version to stderr.
    bool print_gl_info = true;
};

// Renders spec at spec.outputWidth() x spec.outputHeight().
// Returns false and fills *error (if non-null) when the GL context, the
// framebuffer or the read-back fails.
bool renderChart(const ChartSpec& spec, const RenderOptions& opt, RgbaImage& out, std::string* error);

} // namespace vis
} // namespace cyclecmp
