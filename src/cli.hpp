#pragma once

#include <cstdio>
#include <istream>

// Whole command-line run: parses argv, asks `in` for a file name when none
// is given, runs the pipeline and prints the final verdict on `out`.
// Diagnostics go to `err`. Returns the process exit status
// (0 success, 1 pipeline failure, 2 usage error).
int run_cli(int argc, const char* const* argv, std::istream& in, FILE* out, FILE* err);
