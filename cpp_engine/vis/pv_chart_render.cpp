// vis/pv_chart_render.cpp
//
// Draws a ChartSpec with ImPlot into an off-screen framebuffer.
// - GLFW only provides the GL context (hidden window, no input handling).
// - Sizes from the spec are logical 96 DPI pixels, scaled by spec.scale().
// - Linux GL: framebuffer-object entry points come from glext prototypes.

#include "pv_chart_render.h"

#include <cmath>
#include <cstdio>
#include <cstdint>
#include <vector>

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_opengl3.h"

#ifndef GL_GLEXT_PROTOTYPES
#define GL_GLEXT_PROTOTYPES 1
#endif
#include <GLFW/glfw3.h>
#include <GL/gl.h>
#include <GL/glext.h>

namespace cyclecmp {
namespace vis {

namespace {

constexpr float kBaseFont_px = 13.0f; // ImGui default font size

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static void setError(std::string* error, const char* msg) {
    if (error) *error = msg ? msg : "(null)";
}

static inline ImVec2 scaled(const ImVec2& v, float s) { return ImVec2(v.x * s, v.y * s); }

static inline ImVec4 toImVec4(const ColorRGBA& c) { return ImVec4(c.r, c.g, c.b, c.a); }

// Owns everything created for one off-screen render; releases in reverse order.
struct OffscreenContext {
    bool glfw = false;
    GLFWwindow* window = nullptr;
    GLuint fbo = 0;
    GLuint rbo = 0;
    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_gl3 = false;

    ~OffscreenContext() {
        if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        if (window) {
            if (fbo) glDeleteFramebuffers(1, &fbo);
            if (rbo) glDeleteRenderbuffers(1, &rbo);
            glfwDestroyWindow(window);
        }
        if (glfw) glfwTerminate();
    }
};

struct ChartFonts {
    ImFont* title = nullptr;
    ImFont* label = nullptr;
};

static ChartFonts loadFonts(const ChartSpec& spec, float scale) {
    ImGuiIO& io = ImGui::GetIO();
    ChartFonts fonts;

    ImFontConfig label_cfg;
    label_cfg.SizePixels = spec.label_font_px * scale;
    fonts.label = io.Fonts->AddFontDefault(&label_cfg);

    ImFontConfig title_cfg;
    title_cfg.SizePixels = spec.title_font_px * scale;
    fonts.title = io.Fonts->AddFontDefault(&title_cfg);
    return fonts;
}

static void applyStyle(float scale) {
    ImGui::StyleColorsLight();
    ImGuiStyle& gs = ImGui::GetStyle();
    gs.ScaleAllSizes(scale);
    gs.WindowBorderSize = 0.0f;
    gs.Colors[ImGuiCol_WindowBg] = ImVec4(1.0f, 1.0f, 1.0f, 1.0f);

    ImPlot::StyleColorsLight();
    ImPlotStyle& ps = ImPlot::GetStyle();
    ps.Colors[ImPlotCol_FrameBg] = ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
    ps.Colors[ImPlotCol_PlotBg] = ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
    ps.Colors[ImPlotCol_LegendBg] = ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
    ps.PlotBorderSize *= scale;
    ps.MajorTickLen = scaled(ps.MajorTickLen, scale);
    ps.MinorTickLen = scaled(ps.MinorTickLen, scale);
    ps.MajorTickSize = scaled(ps.MajorTickSize, scale);
    ps.MinorTickSize = scaled(ps.MinorTickSize, scale);
    ps.MajorGridSize = scaled(ps.MajorGridSize, scale);
    ps.MinorGridSize = scaled(ps.MinorGridSize, scale);
    ps.PlotPadding = scaled(ps.PlotPadding, scale);
    ps.LabelPadding = scaled(ps.LabelPadding, scale);
    ps.LegendPadding = scaled(ps.LegendPadding, scale);
    ps.LegendInnerPadding = scaled(ps.LegendInnerPadding, scale);
    ps.LegendSpacing = scaled(ps.LegendSpacing, scale);
}

static void drawFrame(const ChartSpec& spec, const ChartFonts& fonts, float scale) {
    ImGuiIO& io = ImGui::GetIO();

    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(io.DisplaySize);
    const ImGuiWindowFlags win_flags = ImGuiWindowFlags_NoDecoration
                                     | ImGuiWindowFlags_NoMove
                                     | ImGuiWindowFlags_NoSavedSettings
                                     | ImGuiWindowFlags_NoBringToFrontOnFocus;
    ImGui::Begin("##PVChartFigure", nullptr, win_flags);

    ImGui::PushFont(fonts.title);
    const float title_w = ImGui::CalcTextSize(spec.title.c_str()).x;
    ImGui::SetCursorPosX(0.5f * (ImGui::GetWindowWidth() - title_w));
    ImGui::TextUnformatted(spec.title.c_str());
    ImGui::PopFont();

    ImGui::PushFont(fonts.label);
    const ImPlotFlags plot_flags = ImPlotFlags_NoTitle
                                 | ImPlotFlags_NoInputs
                                 | ImPlotFlags_NoMenus
                                 | ImPlotFlags_NoBoxSelect
                                 | ImPlotFlags_NoMouseText;
    if (ImPlot::BeginPlot("##PV", ImVec2(-1.0f, -1.0f), plot_flags)) {
        const ImPlotAxisFlags axis_flags = spec.show_grid ? ImPlotAxisFlags_None : ImPlotAxisFlags_NoGridLines;
        ImPlot::SetupAxes(spec.x_label.c_str(), spec.y_label.c_str(), axis_flags, axis_flags);
        ImPlot::SetupAxesLimits(spec.viewport.V_min, spec.viewport.V_max,
                                spec.viewport.P_min, spec.viewport.P_max,
                                ImPlotCond_Always);
        ImPlot::SetupLegend(ImPlotLocation_NorthEast);

        // Lines first so the legend order is Dual, Otto, Diesel, Atkinson.
        for (const auto& s : spec.series) {
            if (s.line_V.empty()) continue;
            ImPlot::SetNextLineStyle(toImVec4(s.color), s.line_weight_px * scale);
            ImPlot::PlotLine(s.label.c_str(), s.line_V.data(), s.line_P.data(),
                             static_cast<int>(s.line_V.size()));
        }

        // State markers carry "##" ids so they stay out of the legend.
        for (const auto& s : spec.series) {
            if (s.marker_V.empty()) continue;
            const std::string id = "##" + s.label + " states";
            ImPlot::SetNextMarkerStyle(ImPlotMarker_Circle, s.marker_size_px * scale,
                                       toImVec4(s.color), 1.0f * scale, toImVec4(s.color));
            ImPlot::PlotScatter(id.c_str(), s.marker_V.data(), s.marker_P.data(),
                                static_cast<int>(s.marker_V.size()));
        }

        ImPlot::EndPlot();
    }
    ImGui::PopFont();

    ImGui::End();
}

} // namespace

bool renderChart(const ChartSpec& spec, const RenderOptions& opt, RgbaImage& out, std::string* error) {
    const int W = spec.outputWidth();
    const int H = spec.outputHeight();
    const float scale = static_cast<float>(spec.scale());
    if (W <= 0 || H <= 0 || !(scale > 0.0f)) {
        setError(error, "chart has no drawable size");
        return false;
    }

    OffscreenContext ctx;

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        setError(error, "glfwInit failed");
        return false;
    }
    ctx.glfw = true;

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    // Hidden, but glfwInit/glfwCreateWindow still need a display server (X11 or
    // Wayland). On a headless host run under a virtual one, e.g. xvfb-run.
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);

    ctx.window = glfwCreateWindow(64, 64, "CycleCompare", nullptr, nullptr);
    if (!ctx.window) {
        setError(error, "glfwCreateWindow failed (no display or OpenGL 3.0 context)");
        return false;
    }
    glfwMakeContextCurrent(ctx.window);

    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        setError(error, "OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
        return false;
    }
    if (opt.print_gl_info) {
        std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
        std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
        std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);
    }

    GLint max_rb = 0;
    glGetIntegerv(GL_MAX_RENDERBUFFER_SIZE, &max_rb);
    if (max_rb < W || max_rb < H) {
        setError(error, "chart exceeds GL_MAX_RENDERBUFFER_SIZE");
        return false;
    }

    glGenFramebuffers(1, &ctx.fbo);
    glBindFramebuffer(GL_FRAMEBUFFER, ctx.fbo);
    glGenRenderbuffers(1, &ctx.rbo);
    glBindRenderbuffer(GL_RENDERBUFFER, ctx.rbo);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_RGBA8, W, H);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_RENDERBUFFER, ctx.rbo);
    if (glCheckFramebufferStatus(GL_FRAMEBUFFER) != GL_FRAMEBUFFER_COMPLETE) {
        setError(error, "off-screen framebuffer incomplete");
        return false;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ctx.imgui_ctx = true;
    ImPlot::CreateContext();
    ctx.implot_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    io.LogFilename = nullptr;
    io.DisplaySize = ImVec2(static_cast<float>(W), static_cast<float>(H));
    io.DisplayFramebufferScale = ImVec2(1.0f, 1.0f);

    const ChartFonts fonts = loadFonts(spec, scale);
    applyStyle(scale);

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        setError(error, "ImGui_ImplOpenGL3_Init failed");
        return false;
    }
    ctx.imgui_gl3 = true;

    const int frames = (opt.frames > 0) ? opt.frames : 1;
    for (int f = 0; f < frames; ++f) {
        ImGui_ImplOpenGL3_NewFrame();
        io.DisplaySize = ImVec2(static_cast<float>(W), static_cast<float>(H));
        io.DeltaTime = 1.0f / 60.0f;
        ImGui::NewFrame();

        drawFrame(spec, fonts, scale);

        ImGui::Render();

        glBindFramebuffer(GL_FRAMEBUFFER, ctx.fbo);
        glViewport(0, 0, W, H);
        glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    }
    glFinish();

    // Drop stale error flags so the check below only sees the read-back.
    for (int i = 0; i < 16 && glGetError() != GL_NO_ERROR; ++i) {
    }

    std::vector<std::uint8_t> raw(static_cast<std::size_t>(W) * static_cast<std::size_t>(H) * 4u);
    glBindFramebuffer(GL_FRAMEBUFFER, ctx.fbo);
    glReadBuffer(GL_COLOR_ATTACHMENT0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(0, 0, W, H, GL_RGBA, GL_UNSIGNED_BYTE, raw.data());
    if (glGetError() != GL_NO_ERROR) {
        setError(error, "glReadPixels failed");
        return false;
    }

    // GL rows are bottom-up; PNG rows are top-down. Output is opaque.
    const std::size_t stride = static_cast<std::size_t>(W) * 4u;
    out.width = W;
    out.height = H;
    out.pixels.assign(raw.size(), 0u);
    for (int y = 0; y < H; ++y) {
        const std::uint8_t* src = raw.data() + static_cast<std::size_t>(H - 1 - y) * stride;
        std::uint8_t* dst = out.pixels.data() + static_cast<std::size_t>(y) * stride;
        for (std::size_t i = 0; i < stride; i += 4) {
            dst[i + 0] = src[i + 0];
            dst[i + 1] = src[i + 1];
            dst[i + 2] = src[i + 2];
            dst[i + 3] = 255u;
        }
    }
    return true;
}

} // namespace vis
} // namespace cyclecmp
