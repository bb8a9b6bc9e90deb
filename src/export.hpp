#pragma once

#include "canvas.hpp"

#include <string>

// Writes `canvas` as an 8-bit RGB PNG, replacing any existing file.
// Returns empty string on success, or an error message on failure.
std::string export_png(const char* path, const Canvas& canvas);
