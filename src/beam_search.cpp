#include "beam_search.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

BeamFrontier::BeamFrontier(const SequenceModel& model, const EncoderContext& ctx, ScoreMode score_mode)
    : model(model), ctx(ctx), score_mode(score_mode) {
}

void BeamFrontier::reset(int bos_id, int capacity) {
    Beam b0;
    b0.tokens.push_back(bos_id);
    b0.score = 0.f;

    active_beams.clear();
    active_beams.push_back(std::move(b0));
    cur_capacity = capacity;
}

void BeamFrontier::assign(std::vector<Beam> active, int capacity) {
    active_beams = std::move(active);
    cur_capacity = capacity;
}

std::vector<int> BeamFrontier::top_k_tokens(const std::vector<float>& probs, int k) {
    const int vocab_size = (int)probs.size();
    k = std::min(std::max(k, 0), vocab_size);

    std::vector<int> ids(vocab_size);
    std::iota(ids.begin(), ids.end(), 0);
    std::partial_sort(ids.begin(), ids.begin() + k, ids.end(), [&](int a, int b) {
        if (probs[a] != probs[b]) return probs[a] > probs[b];
        return a < b;
    });
    ids.resize(k);
    return ids;
}

float BeamFrontier::token_score(float p) const {
    if (score_mode == ScoreMode::log_probability) {
        return std::log(p + 1e-9f);
    }
    return p;
}

const std::vector<Beam>& BeamFrontier::expand() {
    std::vector<Beam> candidates;
    candidates.reserve(active_beams.size() * std::max(cur_capacity, 0));

    for (const Beam& beam : active_beams) {
        auto mask = model.build_mask(beam.tokens);
        std::vector<float> probs = model.next_token_distribution(beam.tokens, ctx, *mask);
        if (probs.empty()) {
            throw std::runtime_error("sequence model returned an empty next token distribution");
        }

        for (int tok : top_k_tokens(probs, cur_capacity)) {
            Beam nb;
            nb.tokens = beam.tokens;
            nb.tokens.push_back(tok);
            nb.score = beam.score + token_score(probs[tok]);
            candidates.push_back(std::move(nb));
        }
    }

    // stable: among equal scores the earlier generated candidate stays ahead
    std::stable_sort(candidates.begin(), candidates.end(), [](const Beam& a, const Beam& b) { return a.score > b.score; });
    if ((int)candidates.size() > cur_capacity) {
        candidates.resize(std::max(cur_capacity, 0));
    }

    active_beams = std::move(candidates);
    return active_beams;
}

CompletionTracker::CompletionTracker(int eos_id)
    : eos(eos_id) {
}

HarvestResult CompletionTracker::harvest(std::vector<Beam> active, int capacity) {
    HarvestResult r;
    r.active.reserve(active.size());
    r.capacity = capacity;

    for (Beam& beam : active) {
        if (!beam.tokens.empty() && beam.tokens.back() == eos) {
            completed_beams.push_back(std::move(beam));
            r.capacity--;
        } else {
            r.active.push_back(std::move(beam));
        }
    }
    return r;
}
