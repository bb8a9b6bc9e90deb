#pragma once

#include <cstdint>
#include <vector>

// One RGB pixel. Byte order matches a PNG RGB8 scanline, so a row of
// Colors can be handed to libpng without conversion.
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

static_assert(sizeof(Color) == 3, "Color must be tightly packed RGB");

inline bool operator==(const Color& a, const Color& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Color& a, const Color& b)
{
    return !(a == b);
}

// Colours in raster scan order.
using PixelSequence = std::vector<Color>;
