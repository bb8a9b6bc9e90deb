#include "pipeline.hpp"
#include "byte_reader.hpp"
#include "export.hpp"
#include "pixel_packer.hpp"

#include <cstdint>
#include <utility>
#include <vector>

const char* pipeline_error_name(PipelineError e)
{
    switch (e) {
        case PipelineError::None:       return "none";
        case PipelineError::FileAccess: return "file access";
        case PipelineError::EmptyInput: return "empty input";
        case PipelineError::TooLarge:   return "too large";
        case PipelineError::Encode:     return "encode";
    }
    return "unknown";
}

static void status(FILE* out, const char* line)
{
    if (!out) return;
    std::fprintf(out, "%s\n", line);
    std::fflush(out);
}

static PipelineResult fail(PipelineError e, std::string msg)
{
    PipelineResult r;
    r.error   = e;
    r.message = std::move(msg);
    return r;
}

PipelineResult run_pipeline(const Options& opts, FILE* out)
{
    FILE* progress = opts.show_progress ? out : nullptr;

    status(out, "Getting bytes from file...");
    std::vector<uint8_t> bytes;
    std::string err = read_file_bytes(opts.input_path.c_str(), bytes);
    if (!err.empty())
        return fail(PipelineError::FileAccess, err);
    if (bytes.empty())
        return fail(PipelineError::EmptyInput,
                    "Input file is empty, nothing to draw: " + opts.input_path);

    status(out, "Assembling pixel colour list...");
    PixelSequence pixels = pack_pixels(bytes, progress);
    std::vector<uint8_t>().swap(bytes);  // release before the canvas grows

    status(out, "Creating image...");
    if (!canvas_fits(pixels.size()))
        return fail(PipelineError::TooLarge,
                    "Input is too large for a single PNG image: " + opts.input_path);
    const CanvasSize cs = canvas_size(pixels.size());
    Canvas canvas;
    canvas.resize(cs.width, cs.height);

    status(out, "Drawing pixel data to image...");
    render_canvas(pixels, canvas, progress);
    PixelSequence().swap(pixels);

    status(out, "Saving image...");
    err = export_png(opts.output_path.c_str(), canvas);
    if (!err.empty()) {
        PipelineResult r = fail(PipelineError::Encode, err);
        r.size = cs;
        return r;
    }

    PipelineResult r;
    r.size = cs;
    return r;
}
