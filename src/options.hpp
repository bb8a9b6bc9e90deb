#pragma once

#include <cstdio>
#include <string>

struct Options {
    std::string input_path;                 // empty = prompt on stdin
    std::string output_path   = "saved.png";
    bool        show_progress = true;
    bool        show_help     = false;
};

// Fills `opts` from the command line. The last positional argument is the
// input file. Returns empty string on success, or an error message.
std::string parse_options(int argc, const char* const* argv, Options& opts);

void print_usage(FILE* out, const char* argv0);
