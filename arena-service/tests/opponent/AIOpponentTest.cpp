/**
 * @file AIOpponentTest.cpp
 * @brief AIOpponent behaviour and long-run convergence to the target win rate
 *
 * Сходимость проверяется на игроках, против которых цель достижима:
 * постоянный ход и цикл. Против равномерно случайного игрока никакая
 * стратегия не выигрывает больше 1/3.
 */

#include <gtest/gtest.h>
#include "application/MoveHistoryStore.hpp"
#include "application/opponent/AIOpponent.hpp"
#include "application/opponent/WinRateController.hpp"
#include "domain/enums/Outcome.hpp"
#include "../mocks/SeededRandomSource.hpp"
#include <functional>

using namespace arena;
using namespace arena::application;
using namespace arena::application::opponent;
using arena::tests::SeededRandomSource;
using domain::Action;
using domain::Difficulty;

class AIOpponentTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = std::make_shared<ConfigRegistry>();
        history_ = std::make_shared<MoveHistoryStore>(config_);
        winRate_ = std::make_shared<WinRateController>(config_);
    }

    /**
     * @brief Сыграть rounds раундов и вернуть итоговую долю побед соперника
     */
    double simulate(const std::function<Action(int)>& player, Difficulty difficulty, int rounds, uint64_t seed) {
        SeededRandomSource random(seed);
        const double target = config_->get().targetWinRate;
        for (int round = 0; round < rounds; ++round) {
            Action move = player(round);
            Action reply = opponent_.selectAction(
                history_->get("acc-1"), difficulty, winRate_->statsFor("acc-1"), target, random);
            auto outcome = domain::resolveOutcome(move, reply);
            history_->append("acc-1", move);
            winRate_->record("acc-1", outcome == domain::Outcome::LOSE);
        }
        return winRate_->statsFor("acc-1").lifetimeRate();
    }

    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<MoveHistoryStore> history_;
    std::shared_ptr<WinRateController> winRate_;
    AIOpponent opponent_;
};

TEST_F(AIOpponentTest, EmptyHistory_UniformChoice) {
    SeededRandomSource random;
    random.queue(0.1);
    random.queue(0.5);
    random.queue(0.9);

    EXPECT_EQ(opponent_.selectAction({}, Difficulty::HARD, {}, 0.75, random), Action::ROCK);
    EXPECT_EQ(opponent_.selectAction({}, Difficulty::HARD, {}, 0.75, random), Action::PAPER);
    EXPECT_EQ(opponent_.selectAction({}, Difficulty::HARD, {}, 0.75, random), Action::SCISSORS);
}

TEST_F(AIOpponentTest, ConfidentPrediction_PlaysCounter) {
    SeededRandomSource random;
    random.queue(0.3);  // доля PAPER: [0.15, 0.90)

    std::vector<Action> history(6, Action::ROCK);
    EXPECT_EQ(opponent_.selectAction(history, Difficulty::HARD, {}, 0.75, random), Action::PAPER);
}

TEST_F(AIOpponentTest, SameInputsAndSeed_SameActions) {
    std::vector<Action> history = {Action::ROCK, Action::PAPER, Action::ROCK, Action::SCISSORS};
    SeededRandomSource first(7);
    SeededRandomSource second(7);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(opponent_.selectAction(history, Difficulty::MEDIUM, {}, 0.75, first),
                  opponent_.selectAction(history, Difficulty::MEDIUM, {}, 0.75, second));
    }
}

// ============================================
// Convergence
// ============================================

TEST_F(AIOpponentTest, ConstantPlayer_HardConvergesToTarget) {
    double rate = simulate([](int) { return Action::ROCK; }, Difficulty::HARD, 2000, 42);
    EXPECT_NEAR(rate, 0.75, 0.03);
}

TEST_F(AIOpponentTest, CyclicPlayer_HardConvergesToTarget) {
    double rate = simulate(
        [](int round) { return domain::ALL_ACTIONS[static_cast<std::size_t>(round) % domain::ACTION_COUNT]; },
        Difficulty::HARD, 2000, 1234);
    EXPECT_NEAR(rate, 0.75, 0.03);
}

TEST_F(AIOpponentTest, ConstantPlayer_MediumConvergesToTarget) {
    double rate = simulate([](int) { return Action::SCISSORS; }, Difficulty::MEDIUM, 2000, 99);
    EXPECT_NEAR(rate, 0.75, 0.03);
}

TEST_F(AIOpponentTest, LowerTarget_AlsoTracked) {
    config_->update([](auto& cfg) { cfg.targetWinRate = 0.6; });
    double rate = simulate([](int) { return Action::PAPER; }, Difficulty::HARD, 2000, 5);
    EXPECT_NEAR(rate, 0.6, 0.03);
}
