#pragma once

#include "color.hpp"

#include <cstdint>
#include <cstdio>
#include <vector>

// Groups bytes into RGB triples in file order. A trailing partial triple
// becomes one more colour with its missing channels set to zero, so the
// result holds ceil(bytes.size() / 3) colours.
// Progress goes to `progress` when non-null.
PixelSequence pack_pixels(const std::vector<uint8_t>& bytes, FILE* progress);
