#include "options.hpp"

#include <cstdio>
#include <cstring>

std::string parse_options(int argc, const char* const* argv, Options& opts)
{
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];

        if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
            opts.show_help = true;
        } else if (std::strcmp(a, "--quiet") == 0 || std::strcmp(a, "-q") == 0) {
            opts.show_progress = false;
        } else if (std::strcmp(a, "--output") == 0 || std::strcmp(a, "-o") == 0) {
            if (i + 1 >= argc)
                return std::string("Missing value for ") + a;
            opts.output_path = argv[++i];
        } else if (a[0] == '-' && a[1] != '\0') {
            return std::string("Unknown option: ") + a;
        } else {
            opts.input_path = a;  // last one wins
        }
    }

    if (opts.output_path.empty())
        return "Output path must not be empty";
    return {};
}

void print_usage(FILE* out, const char* argv0)
{
    std::fprintf(out, "Usage: %s [options] [FILE]\n", argv0);
    std::fprintf(out, "Renders the bytes of FILE as an RGB PNG image.\n\n");
    std::fprintf(out, "  -o, --output PATH  image to write (default: saved.png)\n");
    std::fprintf(out, "  -q, --quiet        no progress bars\n");
    std::fprintf(out, "  -h, --help         show this help\n\n");
    std::fprintf(out, "Without FILE, the file name is read from standard input.\n");
}
