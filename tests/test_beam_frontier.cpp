#include <gtest/gtest.h>
#include <cmath>

#include "beam_search.h"
#include "stub_model.h"

// ─── Top-k token selection ─────────────────────────────────────

TEST(BeamFrontierTest, TopKOrdersByProbability) {
    std::vector<float> probs = {0.1f, 0.4f, 0.2f, 0.3f};
    std::vector<int> top = BeamFrontier::top_k_tokens(probs, 3);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0], 1);
    EXPECT_EQ(top[1], 3);
    EXPECT_EQ(top[2], 2);
}

TEST(BeamFrontierTest, TopKBreaksTiesByLowerId) {
    std::vector<float> probs = {0.25f, 0.25f, 0.25f, 0.25f};
    std::vector<int> top = BeamFrontier::top_k_tokens(probs, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], 0);
    EXPECT_EQ(top[1], 1);
}

TEST(BeamFrontierTest, TopKClampsToVocabSize) {
    std::vector<float> probs = {0.7f, 0.3f};
    EXPECT_EQ(BeamFrontier::top_k_tokens(probs, 5).size(), 2u);
    EXPECT_TRUE(BeamFrontier::top_k_tokens(probs, 0).empty());
}

// ─── Expansion ─────────────────────────────────────────────────

TEST(BeamFrontierTest, ExpansionWidthFollowsCapacity) {
    StubSequenceModel model(5);
    model.set({0}, {0.f, 0.4f, 0.3f, 0.2f, 0.1f});
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx);
    frontier.reset(0, 3);
    const std::vector<Beam>& active = frontier.expand();

    ASSERT_EQ(active.size(), 3u);
    EXPECT_EQ(active[0].tokens, (std::vector<int>{0, 1}));
    EXPECT_EQ(active[1].tokens, (std::vector<int>{0, 2}));
    EXPECT_EQ(active[2].tokens, (std::vector<int>{0, 3}));
    EXPECT_FLOAT_EQ(active[0].score, 0.4f);
    EXPECT_FLOAT_EQ(active[2].score, 0.2f);

    // shrink the capacity: each beam now fans out by 1 only
    std::vector<Beam> two(active.begin(), active.begin() + 2);
    frontier.assign(two, 1);
    frontier.expand();
    EXPECT_EQ(frontier.active().size(), 1u);
    EXPECT_EQ(model.distribution_calls, 3);
}

TEST(BeamFrontierTest, ScoresAccumulateRawProbabilities) {
    StubSequenceModel model(3);
    model.set({0}, {0.f, 0.6f, 0.4f});
    model.set({0, 1}, {0.f, 0.5f, 0.5f});
    model.set({0, 2}, {0.f, 0.9f, 0.1f});
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx);
    frontier.reset(0, 2);
    frontier.expand();
    frontier.expand();

    const auto& active = frontier.active();
    ASSERT_EQ(active.size(), 2u);
    // 0.4 + 0.9 beats 0.6 + 0.5
    EXPECT_EQ(active[0].tokens, (std::vector<int>{0, 2, 1}));
    EXPECT_NEAR(active[0].score, 1.3f, 1e-6);
    EXPECT_EQ(active[1].tokens, (std::vector<int>{0, 1, 1}));
    EXPECT_NEAR(active[1].score, 1.1f, 1e-6);
}

TEST(BeamFrontierTest, LogProbabilityScoring) {
    StubSequenceModel model(3);
    model.set({0}, {0.f, 0.6f, 0.4f});
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx, ScoreMode::log_probability);
    frontier.reset(0, 2);
    frontier.expand();

    const auto& active = frontier.active();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_NEAR(active[0].score, std::log(0.6f), 1e-5);
    EXPECT_NEAR(active[1].score, std::log(0.4f), 1e-5);
}

TEST(BeamFrontierTest, EqualScoresKeepGenerationOrder) {
    StubSequenceModel model(4);
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx);
    Beam a{{0, 1}, 0.5f};
    Beam b{{0, 2}, 0.5f};
    frontier.assign({a, b}, 2);
    frontier.expand();

    // uniform distribution: all four children score 0.75, first parent's children win
    const auto& active = frontier.active();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].tokens, (std::vector<int>{0, 1, 0}));
    EXPECT_EQ(active[1].tokens, (std::vector<int>{0, 1, 1}));
}

TEST(BeamFrontierTest, ExpandLeavesPreviousFrontierIntact) {
    StubSequenceModel model(3);
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx);
    frontier.reset(0, 2);
    std::vector<Beam> before = frontier.expand();
    frontier.expand();

    ASSERT_EQ(before.size(), 2u);
    EXPECT_EQ(before[0].tokens.size(), 2u);
    EXPECT_EQ(frontier.active()[0].tokens.size(), 3u);
}

TEST(BeamFrontierTest, EmptyDistributionIsAnError) {
    StubSequenceModel model(3);
    model.set({0}, {});
    EncoderContext ctx;

    BeamFrontier frontier(model, ctx);
    frontier.reset(0, 2);
    EXPECT_THROW(frontier.expand(), std::runtime_error);
}

// ─── Completion tracking ───────────────────────────────────────

TEST(CompletionTrackerTest, HarvestPartitionsInOrder) {
    CompletionTracker tracker(9);
    std::vector<Beam> active = {
        {{0, 9}, 0.9f},
        {{0, 9}, 0.8f},
        {{0, 4}, 0.7f},
        {{0, 9}, 0.6f},
        {{0, 5}, 0.5f},
    };

    // adjacent completions are all taken, none skipped
    HarvestResult r = tracker.harvest(active, 5);
    EXPECT_EQ(r.capacity, 2);
    ASSERT_EQ(r.active.size(), 2u);
    EXPECT_EQ(r.active[0].tokens.back(), 4);
    EXPECT_EQ(r.active[1].tokens.back(), 5);

    ASSERT_EQ(tracker.completed().size(), 3u);
    EXPECT_FLOAT_EQ(tracker.completed()[0].score, 0.9f);
    EXPECT_FLOAT_EQ(tracker.completed()[1].score, 0.8f);
    EXPECT_FLOAT_EQ(tracker.completed()[2].score, 0.6f);
}

TEST(CompletionTrackerTest, CompletionSetIsAppendOnly) {
    CompletionTracker tracker(3);
    tracker.harvest({{{0, 3}, 1.f}}, 2);
    HarvestResult r = tracker.harvest({{{0, 1}, 0.5f}}, 1);

    EXPECT_EQ(r.capacity, 1);
    EXPECT_EQ(r.active.size(), 1u);
    ASSERT_EQ(tracker.completed().size(), 1u);
    EXPECT_EQ(tracker.completed()[0].tokens, (std::vector<int>{0, 3}));

    r = tracker.harvest({{{0, 1, 3}, 1.5f}}, 1);
    EXPECT_EQ(r.capacity, 0);
    EXPECT_TRUE(r.active.empty());
    EXPECT_EQ(tracker.completed().size(), 2u);
}
