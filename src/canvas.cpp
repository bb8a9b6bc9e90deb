#include "canvas.hpp"
#include "progress.hpp"

#include <climits>
#include <cmath>
#include <cstdint>

struct Dims64 { uint64_t w; uint64_t h; };

// Integer floor(sqrt(n)); std::sqrt alone drifts once n passes 2^52.
static uint64_t isqrt(uint64_t n)
{
    const uint64_t max_root = 0xFFFFFFFFull;  // floor(sqrt(2^64 - 1))

    uint64_t s = static_cast<uint64_t>(std::sqrt(static_cast<double>(n)));
    if (s > max_root) s = max_root;
    while (s > 0 && s * s > n) --s;
    while (s < max_root && (s + 1) * (s + 1) <= n) ++s;
    return s;
}

static Dims64 dims_for(uint64_t n)
{
    if (n == 0) return {0, 0};

    // sqrt(n) is never exactly k + 0.5, so round-half-up is unambiguous:
    // sqrt(n) >= s + 0.5  <=>  n > s*s + s
    const uint64_t s = isqrt(n);
    const uint64_t w = (n > s * s + s) ? s + 1 : s;
    const uint64_t h = n / w + (n % w != 0 ? 1 : 0);
    return {w, h};
}

// ---------------------------------------------------------------------------
// Sizing
// ---------------------------------------------------------------------------
CanvasSize canvas_size(size_t pixel_count)
{
    const Dims64 d = dims_for(pixel_count);
    CanvasSize cs;
    cs.width  = static_cast<int>(d.w);
    cs.height = static_cast<int>(d.h);
    return cs;
}

bool canvas_fits(size_t pixel_count)
{
    const Dims64 d = dims_for(pixel_count);
    return d.w <= static_cast<uint64_t>(INT_MAX)
        && d.h <= static_cast<uint64_t>(INT_MAX);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------
void render_canvas(const PixelSequence& pixels, Canvas& canvas, FILE* progress)
{
    const long long cells  = static_cast<long long>(canvas.width) * canvas.height;
    const long long target = cells - 1;
    const size_t    n      = pixels.size();

    size_t i = 0;
    for (int y = 0; y < canvas.height; ++y) {
        Color* row = canvas.pixels.data() + static_cast<size_t>(y) * canvas.width;
        for (int x = 0; x < canvas.width; ++x) {
            row[x] = (i < n) ? pixels[i] : Color{};

            const long long at = static_cast<long long>(i);
            update_progress(progress, at, at - 1, target);
            ++i;
        }
    }

    if (progress && target > 0) std::fputc('\n', progress);
}
