#pragma once

#include "ports/output/IRandomSource.hpp"
#include "domain/DifficultyProfile.hpp"
#include "domain/PatternAnalysis.hpp"
#include "domain/enums/Action.hpp"

namespace arena::application::opponent {

/**
 * @brief Распределение ходов соперника и выбор хода
 *
 * Смесь трёх компонент:
 * - контр-ход к предсказанному ходу игрока (вес растёт с уверенностью и bias > 0);
 * - ход, дающий ничью (малый вес tieWeight);
 * - равномерная часть, не меньше randomnessFloor профиля.
 *
 * При bias = 0 и полной уверенности вес контр-хода подобран так, чтобы
 * вероятность победы соперника равнялась target:
 *   w* = (3 * target - 1 + tieWeight) / 2
 */
class MoveSelector {
public:
    static domain::MoveDistribution distribution(
        const domain::PatternAnalysis& analysis,
        const domain::DifficultyProfile& profile,
        double bias,
        double target
    );

    /**
     * @brief Выбрать ход по распределению одним числом из random
     */
    static domain::Action sample(const domain::MoveDistribution& distribution,
                                 ports::output::IRandomSource& random);
};

} // namespace arena::application::opponent
