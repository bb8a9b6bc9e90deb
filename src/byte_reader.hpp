#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Loads the whole file at `path` into `out`.
// Returns empty string on success, or an error message on failure; `out`
// is left empty on failure.
std::string read_file_bytes(const char* path, std::vector<uint8_t>& out);
