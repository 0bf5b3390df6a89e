#pragma once

#include "ports/output/IOpponentStrategy.hpp"
#include "application/opponent/PatternRecognizer.hpp"

namespace arena::application::opponent {

/**
 * @brief Соперник, сходящийся к целевой доле побед
 *
 * Один алгоритм для всех уровней сложности, уровень выбирает только
 * DifficultyProfile. Результат определяется аргументами; вся случайность
 * берётся из переданного IRandomSource.
 */
class AIOpponent : public ports::output::IOpponentStrategy {
public:
    AIOpponent() = default;

    domain::Action selectAction(
        const std::vector<domain::Action>& history,
        domain::Difficulty difficulty,
        const domain::WinRateStats& stats,
        double targetWinRate,
        ports::output::IRandomSource& random
    ) override;

private:
    PatternRecognizer recognizer_;
};

} // namespace arena::application::opponent
