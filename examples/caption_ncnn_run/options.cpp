#include "options.h"

#include "util.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cout
        << "Usage: " << (argv0 ? argv0 : "caption_ncnn_run") << " [options] [image-path ...]\n"
        << "\n"
        << "Options:\n"
        << "  --model <path>             Model path (default: $CAPTION_NCNN_MODEL or ./assets/caption_vit_bert)\n"
        << "  --beam-size <n>            Beam width (default: 3)\n"
        << "  --max-steps <n>            Maximum generated tokens (default: model max_seq_len - 1)\n"
        << "  --device <cpu|vulkan>      Inference device (default: cpu)\n"
        << "  --log-prob                 Rank beams by summed log probabilities\n"
        << "  --diagnostics              Print the beam state after every step\n"
        << "  --output <file>            Write {image_id, caption} records as json\n"
        << "  --help                     Show this help\n"
        << "\n"
        << "Examples:\n"
        << "  " << (argv0 ? argv0 : "caption_ncnn_run") << " ./data/images/test.jpg\n"
        << "  " << (argv0 ? argv0 : "caption_ncnn_run")
        << " --beam-size 5 --output results/results_beam5.json a.jpg b.jpg\n";
}

int require_int(int argc, char** argv, int& i, const char* flag) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        std::exit(2);
    }
    auto v = parse_int(argv[++i]);
    if (!v) {
        std::cerr << "Invalid " << flag << " value\n";
        std::exit(2);
    }
    return *v;
}

std::string require_value(int argc, char** argv, int& i, const char* flag) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        std::exit(2);
    }
    return argv[++i];
}

} // namespace

Options parse_options(int argc, char** argv) {
    Options opt;
    bool only_paths = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (only_paths || a.empty() || a[0] != '-') {
            opt.image_paths.push_back(a);
        } else if (a == "--") {
            only_paths = true;
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (a == "--model") {
            opt.model_path = require_value(argc, argv, i, "--model");
        } else if (a == "--beam-size") {
            opt.beam_size = require_int(argc, argv, i, "--beam-size");
        } else if (a == "--max-steps") {
            opt.max_steps = require_int(argc, argv, i, "--max-steps");
        } else if (a == "--device") {
            opt.device = require_value(argc, argv, i, "--device");
            if (opt.device != "cpu" && opt.device != "vulkan") {
                std::cerr << "Invalid --device value (expected cpu|vulkan)\n";
                std::exit(2);
            }
        } else if (a == "--log-prob") {
            opt.log_prob = true;
        } else if (a == "--diagnostics") {
            opt.diagnostics = true;
        } else if (a == "--output") {
            opt.output_path = require_value(argc, argv, i, "--output");
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            std::exit(2);
        }
    }

    if (opt.image_paths.empty()) {
        opt.image_paths.push_back("./data/images/test.jpg");
    }
    return opt;
}
