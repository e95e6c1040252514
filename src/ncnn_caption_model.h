// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include <ncnn/mat.h>
#include <ncnn/net.h>

#include "caption_model.h"
#include "model_config.h"
#include "utils/wordpiece_vocab.h"

struct ncnn_caption_encoder_ctx : public EncoderContext
{
    ncnn::Mat image_features;
};

struct ncnn_caption_mask : public DecoderMask
{
    ncnn::Mat mask;
};

class ncnn_caption_model : public SequenceModel {
private:
    std::shared_ptr<ncnn::Net> encoder_net;
    std::shared_ptr<ncnn::Net> embed_net;
    std::shared_ptr<ncnn::Net> decoder_net;
    std::shared_ptr<ncnn::Net> proj_out_net;
    std::shared_ptr<WordPieceVocab> vocab;

    ModelConfig config;

public:
    ncnn_caption_model(const std::string& model_path, bool use_vulkan = false);

    std::shared_ptr<const EncoderContext> encode(const cv::Mat& bgr) const override;
    std::shared_ptr<const DecoderMask> build_mask(const std::vector<int>& tokens) const override;
    std::vector<float> next_token_distribution(const std::vector<int>& tokens, const EncoderContext& ctx, const DecoderMask& mask) const override;

    const WordPieceVocab& vocabulary() const { return *vocab; }
    const ModelConfig& model_config() const { return config; }

private:
    ncnn::Mat bgr_to_pixel_values(const cv::Mat& bgr) const;
};
