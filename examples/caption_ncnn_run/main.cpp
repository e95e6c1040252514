#include "cli_runner.h"
#include "options.h"

#include "ncnn_caption_model.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    Options opt = parse_options(argc, argv);
    if (opt.model_path.empty()) {
        const char* env = std::getenv("CAPTION_NCNN_MODEL");
        opt.model_path = env ? env : "./assets/caption_vit_bert";
    }

    std::unique_ptr<ncnn_caption_model> model;
    try {
        model = std::make_unique<ncnn_caption_model>(opt.model_path, opt.device == "vulkan");
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    fprintf(stderr, "model %s loaded on %s\n", opt.model_path.c_str(), opt.device.c_str());

    return run_cli(opt, *model);
}
