#include "export.hpp"

#include <png.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

// ---------------------------------------------------------------------------
// PNG export
//
// Canvas rows are tightly packed Color{r, g, b}, which is exactly what
// PNG_COLOR_TYPE_RGB at bit depth 8 expects, so rows go straight to libpng.
// No tIME chunk is written: the same canvas always encodes to the same bytes.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const Canvas& canvas)
{
    if (canvas.width <= 0 || canvas.height <= 0)
        return "Refusing to write an empty image";
    if (canvas.pixels.size() !=
            static_cast<size_t>(canvas.width) * static_cast<size_t>(canvas.height))
        return "Canvas pixel buffer does not match its dimensions";

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path
             + " (" + std::strerror(errno) + ")";

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(canvas.width),
                 static_cast<png_uint_32>(canvas.height),
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < canvas.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            canvas.pixels.data() + static_cast<size_t>(y) * canvas.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    const bool flushed = std::fflush(fp) == 0 && !std::ferror(fp);
    const int  err     = errno;
    if (std::fclose(fp) != 0 || !flushed)
        return std::string("Failed to finish writing ") + path
             + " (" + std::strerror(flushed ? errno : err) + ")";
    return {};  // success
}
