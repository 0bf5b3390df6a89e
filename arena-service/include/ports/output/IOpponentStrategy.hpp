#pragma once

#include "ports/output/IRandomSource.hpp"
#include "domain/enums/Action.hpp"
#include "domain/enums/Difficulty.hpp"
#include "domain/WinRateStats.hpp"
#include <vector>

namespace arena::ports::output {

/**
 * @brief Стратегия выбора хода соперника
 *
 * Результат зависит только от аргументов. Реализация по умолчанию -
 * application::opponent::AIOpponent.
 */
class IOpponentStrategy {
public:
    virtual ~IOpponentStrategy() = default;

    /**
     * @param history Последние ходы игрока (старые первыми)
     * @param difficulty Уровень сложности раунда
     * @param stats Фактическая статистика побед соперника
     * @param targetWinRate Целевая доля побед соперника
     * @param random Источник случайности
     */
    virtual domain::Action selectAction(
        const std::vector<domain::Action>& history,
        domain::Difficulty difficulty,
        const domain::WinRateStats& stats,
        double targetWinRate,
        IRandomSource& random
    ) = 0;
};

} // namespace arena::ports::output
