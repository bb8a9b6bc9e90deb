#include "cli.hpp"
#include "options.hpp"
#include "pipeline.hpp"

#include <string>

static constexpr const char* MSG_DONE   = "All done!";
static constexpr const char* MSG_FAILED = "Unable to create image!";

int run_cli(int argc, const char* const* argv, std::istream& in, FILE* out, FILE* err)
{
    const char* argv0 = (argc > 0 && argv[0]) ? argv[0] : "bytecanvas";

    Options opts;
    const std::string usage_err = parse_options(argc, argv, opts);
    if (!usage_err.empty()) {
        std::fprintf(err, "error: %s\n", usage_err.c_str());
        print_usage(err, argv0);
        std::fprintf(out, "%s\n", MSG_FAILED);
        return 2;
    }
    if (opts.show_help) {
        print_usage(out, argv0);
        return 0;
    }

    if (opts.input_path.empty()) {
        std::fprintf(out, "Enter a file name: ");
        std::fflush(out);
        if (!std::getline(in, opts.input_path) || opts.input_path.empty()) {
            std::fprintf(err, "error: no file name given\n");
            std::fprintf(out, "%s\n", MSG_FAILED);
            return 1;
        }
    }

    const PipelineResult res = run_pipeline(opts, out);
    if (!res.ok()) {
        std::fprintf(err, "error (%s): %s\n",
                     pipeline_error_name(res.error), res.message.c_str());
        std::fprintf(out, "%s\n", MSG_FAILED);
        return 1;
    }

    std::fprintf(out, "%s\n", MSG_DONE);
    return 0;
}
