#include "caption_generator.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

static std::string format_texts(const Vocabulary& vocab, const std::vector<Beam>& beams) {
    std::string out = "[";
    for (size_t i = 0; i < beams.size(); i++) {
        if (i) out += ", ";
        out += "'" + vocab.detokenize(beams[i].tokens, false) + "'";
    }
    out += "]";
    return out;
}

static std::string format_scores(const std::vector<Beam>& beams) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < beams.size(); i++) {
        if (i) oss << ", ";
        oss << beams[i].score;
    }
    oss << "]";
    return oss.str();
}

CaptionGenerator::CaptionGenerator(const SequenceModel& model, const Vocabulary& vocab)
    : model(model), vocab(vocab) {
}

void CaptionGenerator::validate(const CaptionConfig& cfg) {
    if (cfg.beam_width < 1) {
        throw caption_config_error("beam_width must be >= 1, got " + std::to_string(cfg.beam_width));
    }
    if (cfg.max_steps < 1) {
        throw caption_config_error("max_steps must be >= 1, got " + std::to_string(cfg.max_steps));
    }
}

Beam CaptionGenerator::select_best(const std::vector<Beam>& beams) {
    std::vector<Beam> sorted = beams;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Beam& a, const Beam& b) { return a.score > b.score; });
    return sorted.front();
}

void CaptionGenerator::emit_diagnostics(const CaptionConfig& cfg, int step, int capacity, const std::vector<Beam>& active, const std::vector<Beam>& completed) const {
    std::string text;
    text += "Step " + std::to_string(step) + "/" + std::to_string(cfg.max_steps) + " (" + cfg.device + ")\n";
    text += "Beam size: " + std::to_string(capacity) + "\n";
    text += "Beams: " + format_texts(vocab, active) + "\n";
    text += "Completed beams: " + format_texts(vocab, completed) + "\n";
    text += "Beams score: " + format_scores(active) + "\n";
    text += std::string(100, '-') + "\n";

    if (cfg.diagnostics_callback) {
        cfg.diagnostics_callback(text);
    } else {
        fprintf(stderr, "%s", text.c_str());
    }
}

SearchResult CaptionGenerator::search(const cv::Mat& bgr, const CaptionConfig& cfg) const {
    validate(cfg);

    std::shared_ptr<const EncoderContext> ctx = model.encode(bgr);

    BeamFrontier frontier(model, *ctx, cfg.score_mode);
    frontier.reset(vocab.bos_id(), cfg.beam_width);

    CompletionTracker tracker(vocab.eos_id());

    SearchResult result;
    int step = 0;
    while (true) {
        frontier.expand();

        HarvestResult h = tracker.harvest(frontier.active(), frontier.capacity());
        frontier.assign(std::move(h.active), h.capacity);
        step++;

        if (cfg.step_callback) {
            cfg.step_callback(SearchStep{step, frontier.capacity(), frontier.active(), tracker.completed()});
        }
        if (cfg.diagnostics) {
            emit_diagnostics(cfg, step, frontier.capacity(), frontier.active(), tracker.completed());
        }

        if (frontier.capacity() == 0) {
            result.reason = StopReason::all_completed;
            break;
        }
        if (step == cfg.max_steps) {
            result.reason = StopReason::max_steps;
            break;
        }
        if (frontier.active().empty()) {
            result.reason = StopReason::frontier_exhausted;
            break;
        }
    }

    result.steps = step;
    result.completed = tracker.completed();
    result.active = frontier.active();

    if (!result.completed.empty()) {
        result.best = select_best(result.completed);
    } else if (!result.active.empty()) {
        // nothing reached eos within max_steps, fall back to the best unfinished beam
        result.best = select_best(result.active);
        result.used_fallback = true;
    } else {
        result.best.tokens.push_back(vocab.bos_id());
        result.used_fallback = true;
    }
    return result;
}

std::string CaptionGenerator::generate_caption(const cv::Mat& bgr, const CaptionConfig& cfg) const {
    SearchResult r = search(bgr, cfg);
    return vocab.detokenize(r.best.tokens, true);
}
