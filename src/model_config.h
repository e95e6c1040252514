// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <string>

#include <nlohmann/json.hpp>

#include "utils/wordpiece_vocab.h"

// Contents of <model_path>/model.json, with file names resolved against the model directory.
struct ModelConfig {
    std::string encoder_param;
    std::string encoder_bin;
    std::string embed_token_param;
    std::string embed_token_bin;
    std::string decoder_param;
    std::string decoder_bin;
    std::string proj_out_param;
    std::string proj_out_bin;

    std::string vocab_file;
    SpecialTokensConfig special_tokens;

    int image_size = 224;
    std::array<float, 3> norm_mean = {0.485f, 0.456f, 0.406f};
    std::array<float, 3> norm_std = {0.229f, 0.224f, 0.225f};
    int max_seq_len = 256;
};

ModelConfig parse_model_config(const nlohmann::json& config, const std::string& model_path);

ModelConfig load_model_config(const std::string& model_path);
