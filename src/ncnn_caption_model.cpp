// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#include "ncnn_caption_model.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

#include <opencv2/imgproc/imgproc.hpp>

static void softmax_vec(std::vector<float>& logits) {
    float max_logit = *std::max_element(logits.begin(), logits.end());
    float sum = 0.f;
    for (float& x : logits) {
        x = std::exp(x - max_logit);
        sum += x;
    }
    for (float& x : logits) x /= sum;
}

static std::shared_ptr<ncnn::Net> load_net(const std::string& param_path, const std::string& bin_path, bool use_vulkan) {
    auto net = std::make_shared<ncnn::Net>();
    if (use_vulkan) {
        net->opt.use_vulkan_compute = true;
    }
    if (net->load_param(param_path.c_str()) != 0) {
        throw std::runtime_error("load_param " + param_path + " failed");
    }
    if (net->load_model(bin_path.c_str()) != 0) {
        throw std::runtime_error("load_model " + bin_path + " failed");
    }
    return net;
}

static void extract_blob(ncnn::Extractor& ex, const char* name, ncnn::Mat& out) {
    if (ex.extract(name, out) != 0 || out.empty()) {
        throw std::runtime_error(std::string("extract blob ") + name + " failed");
    }
}

// Class Implementation

ncnn_caption_model::ncnn_caption_model(const std::string& model_path, bool use_vulkan) {
    try {
        config = load_model_config(model_path);

        encoder_net = load_net(config.encoder_param, config.encoder_bin, use_vulkan);
        embed_net = load_net(config.embed_token_param, config.embed_token_bin, use_vulkan);
        decoder_net = load_net(config.decoder_param, config.decoder_bin, use_vulkan);
        proj_out_net = load_net(config.proj_out_param, config.proj_out_bin, use_vulkan);

        vocab = std::make_shared<WordPieceVocab>(WordPieceVocab::LoadFromFile(config.vocab_file, config.special_tokens));
    } catch (std::exception &e) {
        throw std::runtime_error(std::string("ncnn_caption_model load model failed: ") + e.what());
    }
}

ncnn::Mat ncnn_caption_model::bgr_to_pixel_values(const cv::Mat& bgr) const {
    const int size = config.image_size;

    cv::Mat bgr_resized;
    cv::resize(bgr, bgr_resized, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);

    ncnn::Mat pixel_values(size, size, 3);
    float* ptr_r = pixel_values.channel(0);
    float* ptr_g = pixel_values.channel(1);
    float* ptr_b = pixel_values.channel(2);

    const std::array<float, 3>& mean = config.norm_mean;
    const std::array<float, 3>& std_ = config.norm_std;

    for (int y = 0; y < size; y++) {
        const uchar* img_row_ptr = bgr_resized.ptr<uchar>(y);
        for (int x = 0; x < size; x++) {
            const uchar* pixel = img_row_ptr + x * 3;
            *ptr_r++ = (pixel[2] / 255.f - mean[0]) / std_[0];
            *ptr_g++ = (pixel[1] / 255.f - mean[1]) / std_[1];
            *ptr_b++ = (pixel[0] / 255.f - mean[2]) / std_[2];
        }
    }
    return pixel_values;
}

std::shared_ptr<const EncoderContext> ncnn_caption_model::encode(const cv::Mat& image) const {
    if (image.empty()) {
        throw std::runtime_error("encode: empty image");
    }

    cv::Mat bgr;
    if (image.type() == CV_8UC3) {
        bgr = image;
    } else if (image.type() == CV_8UC1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else if (image.type() == CV_8UC4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else {
        throw std::runtime_error("encode: unsupported image type " + std::to_string(image.type()));
    }

    ncnn::Mat pixel_values = bgr_to_pixel_values(bgr);

    auto ctx = std::make_shared<ncnn_caption_encoder_ctx>();
    {
        ncnn::Extractor ex = encoder_net->create_extractor();
        ex.input("in0", pixel_values);
        extract_blob(ex, "out0", ctx->image_features);
    }
    return ctx;
}

std::shared_ptr<const DecoderMask> ncnn_caption_model::build_mask(const std::vector<int>& tokens) const {
    const int seqlen = (int)tokens.size();

    auto m = std::make_shared<ncnn_caption_mask>();
    m->mask.create(seqlen, seqlen);
    m->mask.fill(0.0f);
    for (int i = 0; i < seqlen; i++) {
        float* row = m->mask.row(i);
        for (int j = i + 1; j < seqlen; j++) {
            row[j] = -1e38f;
        }
    }
    return m;
}

std::vector<float> ncnn_caption_model::next_token_distribution(const std::vector<int>& tokens, const EncoderContext& ctx, const DecoderMask& mask) const {
    const auto* enc = dynamic_cast<const ncnn_caption_encoder_ctx*>(&ctx);
    const auto* dec_mask = dynamic_cast<const ncnn_caption_mask*>(&mask);
    if (!enc || !dec_mask) {
        throw std::invalid_argument("next_token_distribution: context or mask not produced by ncnn_caption_model");
    }
    if (tokens.empty()) {
        throw std::runtime_error("next_token_distribution: empty token sequence");
    }
    if ((int)tokens.size() > config.max_seq_len) {
        throw std::runtime_error("next_token_distribution: sequence length " + std::to_string(tokens.size())
                                 + " exceeds max_seq_len " + std::to_string(config.max_seq_len));
    }

    ncnn::Mat input_ids_mat = ncnn::Mat((int)tokens.size(), 1, (void*)tokens.data()).clone();
    ncnn::Mat token_embed;
    {
        ncnn::Extractor ex = embed_net->create_extractor();
        ex.input("in0", input_ids_mat);
        extract_blob(ex, "out0", token_embed);
    }

    ncnn::Mat decode_out;
    {
        ncnn::Extractor ex = decoder_net->create_extractor();
        ex.input("in0", token_embed);
        ex.input("in1", dec_mask->mask);
        ex.input("in2", enc->image_features);
        extract_blob(ex, "out0", decode_out);
    }

    ncnn::Mat last_hidden = decode_out.row_range(decode_out.h - 1, 1).clone();
    ncnn::Mat logits_mat;
    {
        ncnn::Extractor ex = proj_out_net->create_extractor();
        ex.input("in0", last_hidden);
        extract_blob(ex, "out0", logits_mat);
    }

    const int vocab_size = logits_mat.w;
    std::vector<float> probs(vocab_size);
    memcpy(probs.data(), logits_mat.data, sizeof(float) * vocab_size);

    softmax_vec(probs);
    return probs;
}
