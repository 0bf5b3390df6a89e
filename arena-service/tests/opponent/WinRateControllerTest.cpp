/**
 * @file WinRateControllerTest.cpp
 * @brief Unit tests for WinRateController statistics and bias
 */

#include <gtest/gtest.h>
#include "application/opponent/WinRateController.hpp"

using namespace arena;
using namespace arena::application;
using arena::application::opponent::WinRateController;
using domain::WinRateStats;

namespace {

WinRateStats statsOf(int rounds, int wins, std::size_t window = 50) {
    WinRateStats stats;
    for (int i = 0; i < rounds; ++i) {
        stats.record(i < wins, window);
    }
    return stats;
}

} // namespace

class WinRateControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = std::make_shared<ConfigRegistry>();
        controller_ = std::make_shared<WinRateController>(config_);
    }

    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<WinRateController> controller_;
};

// ============================================
// Bias
// ============================================

TEST_F(WinRateControllerTest, Bias_ZeroWithoutRounds) {
    EXPECT_DOUBLE_EQ(WinRateController::bias(WinRateStats{}, 0.75), 0.0);
}

TEST_F(WinRateControllerTest, Bias_ZeroOnTarget) {
    EXPECT_NEAR(WinRateController::bias(statsOf(4, 3), 0.75), 0.0, 1e-12);
}

TEST_F(WinRateControllerTest, Bias_PositiveWhenBelowTarget) {
    // 2 * (0.75 - 0.7) + 0.1 * (7.5 - 7)
    EXPECT_NEAR(WinRateController::bias(statsOf(10, 7), 0.75), 0.15, 1e-9);
}

TEST_F(WinRateControllerTest, Bias_NegativeWhenAboveTarget) {
    // 2 * (0.75 - 0.9) + 0.1 * (7.5 - 9)
    EXPECT_NEAR(WinRateController::bias(statsOf(10, 9), 0.75), -0.45, 1e-9);
}

TEST_F(WinRateControllerTest, Bias_Clamped) {
    EXPECT_DOUBLE_EQ(WinRateController::bias(statsOf(100, 0), 0.75), 1.0);
    EXPECT_DOUBLE_EQ(WinRateController::bias(statsOf(100, 100), 0.75), -1.0);
}

// ============================================
// Statistics
// ============================================

TEST_F(WinRateControllerTest, Record_TracksRollingWindow) {
    config_->update([](auto& cfg) { cfg.winRateWindow = 3; });
    for (bool won : {true, true, false, false, false}) {
        controller_->record("acc-1", won);
    }

    auto stats = controller_->statsFor("acc-1");
    EXPECT_EQ(stats.rounds, 5u);
    EXPECT_EQ(stats.opponentWins, 2u);
    EXPECT_EQ(stats.recent.size(), 3u);
    EXPECT_DOUBLE_EQ(stats.rollingRate(), 0.0);
    EXPECT_DOUBLE_EQ(stats.lifetimeRate(), 0.4);
}

TEST_F(WinRateControllerTest, Scope_PerAccountVsPlatform) {
    controller_->record("acc-1", true);
    controller_->record("acc-2", false);

    EXPECT_EQ(controller_->statsFor("acc-1").rounds, 1u);
    EXPECT_EQ(controller_->statsFor("acc-1").opponentWins, 1u);
    EXPECT_EQ(controller_->statsFor("acc-3").rounds, 0u);

    config_->update([](auto& cfg) { cfg.winRateScope = domain::WinRateScope::PLATFORM; });

    auto platform = controller_->statsFor("acc-3");
    EXPECT_EQ(platform.rounds, 2u);
    EXPECT_EQ(platform.opponentWins, 1u);
}
