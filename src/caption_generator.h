// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include "beam_search.h"
#include "caption_model.h"

class caption_config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct SearchStep {
    int step = 0;
    int capacity = 0;
    const std::vector<Beam>& active;
    const std::vector<Beam>& completed;
};

struct CaptionConfig {
    int max_steps = 256;
    int beam_width = 3;
    std::string device = "cpu";
    bool diagnostics = false;
    ScoreMode score_mode = ScoreMode::probability;

    // diagnostics text sink, stderr when unset
    std::function<void(const std::string&)> diagnostics_callback = nullptr;

    std::function<void(const SearchStep&)> step_callback = nullptr;
};

enum class StopReason {
    all_completed = 0,
    max_steps = 1,
    frontier_exhausted = 2
};

struct SearchResult {
    Beam best;
    std::vector<Beam> completed;
    std::vector<Beam> active;
    int steps = 0;
    StopReason reason = StopReason::max_steps;
    bool used_fallback = false;
};

class CaptionGenerator {
public:
    CaptionGenerator(const SequenceModel& model, const Vocabulary& vocab);

    std::string generate_caption(const cv::Mat& bgr, const CaptionConfig& cfg) const;

    SearchResult search(const cv::Mat& bgr, const CaptionConfig& cfg) const;

    static void validate(const CaptionConfig& cfg);

private:
    static Beam select_best(const std::vector<Beam>& beams);
    void emit_diagnostics(const CaptionConfig& cfg, int step, int capacity, const std::vector<Beam>& active, const std::vector<Beam>& completed) const;

    const SequenceModel& model;
    const Vocabulary& vocab;
};
