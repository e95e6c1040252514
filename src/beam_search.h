// Copyright 2025 Tencent
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "caption_model.h"

enum class ScoreMode {
    probability = 0,     // sum of raw token probabilities
    log_probability = 1  // sum of log(p)
};

struct Beam {
    std::vector<int> tokens;
    float score = 0.f;
};

// Active partial sequences of one caption call.
// expand() replaces the active list with a new vector, so a frontier obtained
// earlier through active() copies stays untouched.
class BeamFrontier {
public:
    BeamFrontier(const SequenceModel& model, const EncoderContext& ctx, ScoreMode score_mode = ScoreMode::probability);

    void reset(int bos_id, int capacity);
    void assign(std::vector<Beam> active, int capacity);

    // Fan out every active beam by `capacity` tokens, then keep the best `capacity` children.
    const std::vector<Beam>& expand();

    const std::vector<Beam>& active() const { return active_beams; }
    int capacity() const { return cur_capacity; }

    // Indices of the k most probable tokens, lower id first on equal probability.
    static std::vector<int> top_k_tokens(const std::vector<float>& probs, int k);

private:
    float token_score(float p) const;

    const SequenceModel& model;
    const EncoderContext& ctx;
    ScoreMode score_mode;

    std::vector<Beam> active_beams;
    int cur_capacity = 0;
};

struct HarvestResult {
    std::vector<Beam> active;
    int capacity = 0;
};

class CompletionTracker {
public:
    explicit CompletionTracker(int eos_id);

    // Moves the beams ending with eos into the completion set, one capacity slot each.
    HarvestResult harvest(std::vector<Beam> active, int capacity);

    const std::vector<Beam>& completed() const { return completed_beams; }

private:
    int eos;
    std::vector<Beam> completed_beams;
};
