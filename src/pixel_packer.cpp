#include "pixel_packer.hpp"
#include "progress.hpp"

PixelSequence pack_pixels(const std::vector<uint8_t>& bytes, FILE* progress)
{
    PixelSequence out;
    out.reserve((bytes.size() + 2) / 3);

    const long long target = static_cast<long long>(bytes.size()) - 1;

    uint8_t slot[3] = {0, 0, 0};
    int     filled  = 0;

    for (size_t i = 0; i < bytes.size(); ++i) {
        slot[filled++] = bytes[i];

        if (filled == 3) {
            out.push_back(Color{slot[0], slot[1], slot[2]});
            slot[0] = slot[1] = slot[2] = 0;
            filled = 0;
        }

        const long long at = static_cast<long long>(i);
        update_progress(progress, at, at - 1, target);
    }

    if (filled > 0)
        out.push_back(Color{slot[0], slot[1], slot[2]});

    if (progress && target > 0) std::fputc('\n', progress);
    return out;
}
