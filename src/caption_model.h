// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

// Image representation produced once per caption call and shared by every beam.
class EncoderContext {
public:
    virtual ~EncoderContext() = default;
};

// Per-beam attention mask, rebuilt from the beam tokens at every step.
class DecoderMask {
public:
    virtual ~DecoderMask() = default;
};

class SequenceModel {
public:
    virtual ~SequenceModel() = default;

    virtual std::shared_ptr<const EncoderContext> encode(const cv::Mat& bgr) const = 0;

    virtual std::shared_ptr<const DecoderMask> build_mask(const std::vector<int>& tokens) const = 0;

    // Probability for every vocabulary id, indexed by token id.
    virtual std::vector<float> next_token_distribution(const std::vector<int>& tokens,
                                                       const EncoderContext& ctx,
                                                       const DecoderMask& mask) const = 0;
};

class Vocabulary {
public:
    virtual ~Vocabulary() = default;

    virtual int bos_id() const = 0;
    virtual int eos_id() const = 0;

    virtual std::string detokenize(const std::vector<int>& tokens, bool skip_special) const = 0;
};
