#pragma once

#include "canvas.hpp"
#include "options.hpp"

#include <cstdio>
#include <string>

enum class PipelineError {
    None       = 0,
    FileAccess = 1,  // input missing, unreadable or failed mid-read
    EmptyInput = 2,  // zero-length file, nothing to draw
    TooLarge   = 3,  // canvas would exceed PNG dimension limits
    Encode     = 4,  // PNG could not be written
};

struct PipelineResult {
    PipelineError error = PipelineError::None;
    std::string   message;   // empty on success
    CanvasSize    size;      // canvas dimensions, when sizing was reached

    bool ok() const { return error == PipelineError::None; }
};

const char* pipeline_error_name(PipelineError e);

// Reads opts.input_path, converts it to an image and saves it to
// opts.output_path. Status lines (and progress bars when
// opts.show_progress) go to `out`, which may be null for a silent run.
PipelineResult run_pipeline(const Options& opts, FILE* out);
