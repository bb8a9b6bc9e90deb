#include "byte_reader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

std::string read_file_bytes(const char* path, std::vector<uint8_t>& out)
{
    out.clear();

    FILE* fp = std::fopen(path, "rb");
    if (!fp)
        return std::string("Cannot open file for reading: ") + path
             + " (" + std::strerror(errno) + ")";

    uint8_t chunk[65536];
    for (;;) {
        const size_t got = std::fread(chunk, 1, sizeof(chunk), fp);
        out.insert(out.end(), chunk, chunk + got);
        if (got < sizeof(chunk)) break;
    }

    if (std::ferror(fp)) {
        const int err = errno;
        std::fclose(fp);
        out.clear();
        return std::string("Read error on ") + path + " (" + std::strerror(err) + ")";
    }

    std::fclose(fp);
    return {};  // success
}
