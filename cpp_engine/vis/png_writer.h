#pragma once

// vis/png_writer.h
//
// RGBA8 raster + PNG encoder (libpng) with physical resolution metadata.
// No ImGui / OpenGL dependencies; usable from tests.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cyclecmp {
namespace vis {

struct RgbaImage {
    int width = 0;
    int height = 0;
    // Row-major, top row first, 4 bytes per pixel.
    std::vector<std::uint8_t> pixels;

    bool isConsistent() const {
        return width > 0 && height > 0 &&
               pixels.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4u;
    }
};

// 300 DPI -> 11811 px/m.
std::uint32_t dpiToPixelsPerMeter(double dpi);

// Writes img as 8-bit RGBA PNG with a pHYs chunk for dpi.
// Returns false and fills *error (if non-null) on any failure; a partially
// written file may remain.
bool writePng(const std::string& path, const RgbaImage& img, double dpi, std::string* error);

} // namespace vis
} // namespace cyclecmp
