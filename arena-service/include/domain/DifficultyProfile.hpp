#pragma once

#include "enums/Difficulty.hpp"

namespace arena::domain {

/**
 * @brief Параметры уровня сложности для MoveSelector
 *
 * Уровни отличаются только параметрами, а не веткой алгоритма.
 */
struct DifficultyProfile {
    double confidence = 1.0;            ///< Множитель доверия к предсказанию
    double confidenceThreshold = 0.25;  ///< Предсказания слабее порога игнорируются
    double randomnessFloor = 0.05;      ///< Минимальная равномерная доля
    double tieWeight = 0.05;            ///< Доля хода, дающего ничью

    static DifficultyProfile forDifficulty(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::EASY:   return {0.60, 0.60, 0.35, 0.05};
            case Difficulty::MEDIUM: return {0.85, 0.40, 0.15, 0.05};
            case Difficulty::HARD:   return {1.00, 0.25, 0.05, 0.05};
        }
        return {};
    }
};

} // namespace arena::domain
