#include "cli_runner.h"

#include "util.h"
#include "utils/caption_results.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <iostream>

#include <opencv2/imgcodecs/imgcodecs.hpp>

CaptionConfig make_caption_config(const Options& opt, const ncnn_caption_model& model) {
    CaptionConfig cfg;
    cfg.beam_width = opt.beam_size;
    cfg.max_steps = opt.max_steps;
    if (cfg.max_steps == 0) {
        // bos occupies one position of the decoder window
        cfg.max_steps = std::max(1, model.model_config().max_seq_len - 1);
    }
    cfg.device = opt.device;
    cfg.diagnostics = opt.diagnostics;
    cfg.score_mode = opt.log_prob ? ScoreMode::log_probability : ScoreMode::probability;
    return cfg;
}

int run_cli(const Options& opt, const ncnn_caption_model& model) {
    CaptionConfig cfg = make_caption_config(opt, model);
    try {
        CaptionGenerator::validate(cfg);
    } catch (const caption_config_error& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }

    CaptionGenerator generator(model, model.vocabulary());

    std::vector<CaptionRecord> records;
    int failed = 0;

    for (const std::string& image_path : opt.image_paths) {
        cv::Mat bgr = cv::imread(image_path, cv::IMREAD_COLOR);
        if (bgr.empty()) {
            fprintf(stderr, "cv::imread %s failed\n", image_path.c_str());
            failed++;
            continue;
        }

        try {
            auto st = std::chrono::steady_clock::now();
            std::string caption = generator.generate_caption(bgr, cfg);
            double elapsed = seconds_since(st);

            std::cout << image_path << "\n";
            std::cout << "--- Caption: " << caption << "\n";
            std::cout << "--- Time: " << elapsed << " (s)" << std::endl;

            records.push_back({image_id_from_path(image_path), caption});
        } catch (const std::exception& e) {
            fprintf(stderr, "caption %s failed: %s\n", image_path.c_str(), e.what());
            failed++;
        }
    }

    if (!opt.output_path.empty()) {
        try {
            save_caption_records(opt.output_path, records);
            fprintf(stderr, "%d captions written to %s\n", (int)records.size(), opt.output_path.c_str());
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
    }

    return failed == 0 ? 0 : 1;
}
