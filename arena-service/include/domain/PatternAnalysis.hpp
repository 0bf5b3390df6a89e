#pragma once

#include "enums/Action.hpp"
#include <array>
#include <optional>
#include <cstddef>

namespace arena::domain {

/**
 * @brief Результат анализа истории ходов игрока
 */
struct PatternAnalysis {
    std::array<std::size_t, ACTION_COUNT> frequencies{};  ///< Частоты ходов в окне
    std::size_t sampleSize = 0;

    std::size_t patternLength = 0;       ///< Длина найденной повторяющейся подпоследовательности (0 - нет)
    std::size_t patternOccurrences = 0;  ///< Сколько раз она встречалась ранее

    std::optional<Action> predicted;     ///< Ожидаемый следующий ход игрока
    double confidence = 0.0;             ///< Уверенность предсказания [0, 1]

    bool hasPattern() const {
        return patternLength > 0;
    }
};

/**
 * @brief Распределение вероятностей по ходам соперника
 */
using MoveDistribution = std::array<double, ACTION_COUNT>;

} // namespace arena::domain
