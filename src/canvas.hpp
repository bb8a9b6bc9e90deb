#pragma once

#include "color.hpp"

#include <cstddef>
#include <cstdio>
#include <vector>

struct CanvasSize {
    int width  = 0;
    int height = 0;
};

// Pixel grid, row-major, tightly packed RGB.
struct Canvas {
    std::vector<Color> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), Color{});
    }
};

// Near-square dimensions for n pixels: width = round(sqrt(n)),
// height = ceil(n / width). n == 0 gives 0x0.
CanvasSize canvas_size(size_t pixel_count);

// False when canvas_size(pixel_count) would exceed what a PNG (or an int)
// can describe.
bool canvas_fits(size_t pixel_count);

// Copies pixels[i] to cell i in row-major order and paints the rest of the
// canvas black. The canvas must already be sized. Progress goes to
// `progress` when non-null.
void render_canvas(const PixelSequence& pixels, Canvas& canvas, FILE* progress);
