/**
 * @file MoveSelectorTest.cpp
 * @brief Unit tests for MoveSelector distribution and sampling
 */

#include <gtest/gtest.h>
#include "application/opponent/MoveSelector.hpp"
#include "../mocks/SeededRandomSource.hpp"
#include <numeric>

using namespace arena;
using arena::application::opponent::MoveSelector;
using arena::tests::SeededRandomSource;
using domain::Action;
using domain::Difficulty;
using domain::DifficultyProfile;
using domain::MoveDistribution;
using domain::PatternAnalysis;

namespace {

PatternAnalysis predicting(Action action, double confidence) {
    PatternAnalysis analysis;
    analysis.predicted = action;
    analysis.confidence = confidence;
    return analysis;
}

double sum(const MoveDistribution& d) {
    return std::accumulate(d.begin(), d.end(), 0.0);
}

double at(const MoveDistribution& d, Action action) {
    return d[domain::index(action)];
}

} // namespace

TEST(MoveSelectorTest, NoPrediction_Uniform) {
    auto d = MoveSelector::distribution(PatternAnalysis{}, DifficultyProfile::forDifficulty(Difficulty::HARD), 1.0, 0.75);
    for (double p : d) {
        EXPECT_NEAR(p, 1.0 / 3.0, 1e-12);
    }
}

TEST(MoveSelectorTest, NeutralBiasFullConfidence_WinProbabilityEqualsTarget) {
    auto hard = DifficultyProfile::forDifficulty(Difficulty::HARD);
    auto d = MoveSelector::distribution(predicting(Action::ROCK, 1.0), hard, 0.0, 0.75);

    // Против ROCK побеждает PAPER, ничью даёт ROCK
    EXPECT_NEAR(at(d, Action::PAPER), 0.75, 1e-12);
    EXPECT_NEAR(at(d, Action::ROCK), 0.15, 1e-12);
    EXPECT_NEAR(at(d, Action::SCISSORS), 0.10, 1e-12);
    EXPECT_NEAR(sum(d), 1.0, 1e-12);
}

TEST(MoveSelectorTest, DistributionSumsToOne_ForAnyBias) {
    for (auto difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        auto profile = DifficultyProfile::forDifficulty(difficulty);
        for (double bias : {-1.0, -0.4, 0.0, 0.3, 1.0, 5.0}) {
            auto d = MoveSelector::distribution(predicting(Action::SCISSORS, 0.9), profile, bias, 0.75);
            EXPECT_NEAR(sum(d), 1.0, 1e-9);
            for (double p : d) {
                EXPECT_GE(p, 0.0);
            }
        }
    }
}

TEST(MoveSelectorTest, MaxBias_KeepsRandomnessFloor) {
    for (auto difficulty : {Difficulty::EASY, Difficulty::MEDIUM, Difficulty::HARD}) {
        auto profile = DifficultyProfile::forDifficulty(difficulty);
        auto d = MoveSelector::distribution(predicting(Action::ROCK, 1.0), profile, 1.0, 0.75);

        // Проигрывающий ход соперника (SCISSORS против ROCK) получает только равномерную часть
        EXPECT_GE(at(d, Action::SCISSORS) * 3.0, profile.randomnessFloor - 1e-12);
    }
}

TEST(MoveSelectorTest, Bias_MovesWinProbability) {
    auto hard = DifficultyProfile::forDifficulty(Difficulty::HARD);
    auto low = MoveSelector::distribution(predicting(Action::ROCK, 1.0), hard, -1.0, 0.75);
    auto mid = MoveSelector::distribution(predicting(Action::ROCK, 1.0), hard, 0.0, 0.75);
    auto high = MoveSelector::distribution(predicting(Action::ROCK, 1.0), hard, 1.0, 0.75);

    EXPECT_LT(at(low, Action::PAPER), at(mid, Action::PAPER));
    EXPECT_LT(at(mid, Action::PAPER), at(high, Action::PAPER));
    EXPECT_NEAR(at(high, Action::PAPER), 0.9 + 0.05 / 3.0, 1e-12);
}

TEST(MoveSelectorTest, BelowThreshold_Uniform) {
    auto easy = DifficultyProfile::forDifficulty(Difficulty::EASY);
    auto d = MoveSelector::distribution(predicting(Action::PAPER, easy.confidenceThreshold - 0.01), easy, 1.0, 0.75);
    for (double p : d) {
        EXPECT_NEAR(p, 1.0 / 3.0, 1e-12);
    }
}

TEST(MoveSelectorTest, HarderProfile_ExploitsMore) {
    auto analysis = predicting(Action::ROCK, 0.8);
    auto easy = MoveSelector::distribution(analysis, DifficultyProfile::forDifficulty(Difficulty::EASY), 0.5, 0.75);
    auto hard = MoveSelector::distribution(analysis, DifficultyProfile::forDifficulty(Difficulty::HARD), 0.5, 0.75);
    EXPECT_GT(at(hard, Action::PAPER), at(easy, Action::PAPER));
}

TEST(MoveSelectorTest, Sample_UsesCumulativeBuckets) {
    MoveDistribution d = {0.2, 0.3, 0.5};
    SeededRandomSource random;
    random.queue(0.1);
    random.queue(0.25);
    random.queue(0.5);
    random.queue(0.999);

    EXPECT_EQ(MoveSelector::sample(d, random), Action::ROCK);
    EXPECT_EQ(MoveSelector::sample(d, random), Action::PAPER);
    EXPECT_EQ(MoveSelector::sample(d, random), Action::SCISSORS);
    EXPECT_EQ(MoveSelector::sample(d, random), Action::SCISSORS);
    EXPECT_EQ(random.callCount(), 4);
}
