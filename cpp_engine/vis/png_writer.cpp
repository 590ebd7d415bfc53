// vis/png_writer.cpp
//
// libpng reports errors by longjmp. Everything with a non-trivial destructor
// is constructed before setjmp so the jump never skips a destructor.

#include "png_writer.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>

#include <png.h>

namespace cyclecmp {
namespace vis {

static void setError(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

std::uint32_t dpiToPixelsPerMeter(double dpi) {
    if (!std::isfinite(dpi) || dpi <= 0.0) return 0u;
    return static_cast<std::uint32_t>(std::lround(dpi / 0.0254));
}

bool writePng(const std::string& path, const RgbaImage& img, double dpi, std::string* error) {
    if (!img.isConsistent()) {
        setError(error, "image buffer does not match its dimensions");
        return false;
    }
    const std::uint32_t ppm = dpiToPixelsPerMeter(dpi);
    if (ppm == 0u) {
        setError(error, "invalid DPI");
        return false;
    }

    std::vector<png_bytep> rows(static_cast<std::size_t>(img.height));
    const std::size_t stride = static_cast<std::size_t>(img.width) * 4u;
    for (int y = 0; y < img.height; ++y) {
        rows[static_cast<std::size_t>(y)] =
            const_cast<png_bytep>(img.pixels.data() + static_cast<std::size_t>(y) * stride);
    }
    const std::string open_failed = "cannot open '" + path + "' for writing: ";
    const std::string encode_failed = "libpng failed while writing '" + path + "'";

    std::FILE* fp = std::fopen(path.c_str(), "wb");
    if (!fp) {
        setError(error, open_failed + std::strerror(errno));
        return false;
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        setError(error, "png_create_write_struct failed");
        return false;
    }
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        setError(error, "png_create_info_struct failed");
        return false;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        setError(error, encode_failed);
        return false;
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(img.width),
                 static_cast<png_uint_32>(img.height),
                 8, PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_pHYs(png, info, ppm, ppm, PNG_RESOLUTION_METER);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    if (std::fclose(fp) != 0) {
        setError(error, "error closing '" + path + "': " + std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace vis
} // namespace cyclecmp
