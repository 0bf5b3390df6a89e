#pragma once

#include <string>
#include <stdexcept>

namespace arena::domain {

/**
 * @brief Уровень сложности соперника
 *
 * Уровень лишь выбирает DifficultyProfile; алгоритм один для всех уровней.
 */
enum class Difficulty {
    EASY,
    MEDIUM,
    HARD
};

inline std::string toString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY:   return "EASY";
        case Difficulty::MEDIUM: return "MEDIUM";
        case Difficulty::HARD:   return "HARD";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline Difficulty difficultyFromString(const std::string& str) {
    if (str == "EASY")   return Difficulty::EASY;
    if (str == "MEDIUM") return Difficulty::MEDIUM;
    if (str == "HARD")   return Difficulty::HARD;
    throw std::invalid_argument("Unknown Difficulty: " + str);
}

} // namespace arena::domain
