#pragma once

#include <string>
#include <vector>

struct Options {
    std::string model_path; // empty = $CAPTION_NCNN_MODEL or ./assets/caption_vit_bert
    std::vector<std::string> image_paths;
    std::string output_path;
    int beam_size = 3;
    int max_steps = 0; // 0 = derive from the model max_seq_len
    std::string device = "cpu"; // cpu|vulkan
    bool log_prob = false;
    bool diagnostics = false;
};

Options parse_options(int argc, char** argv);
