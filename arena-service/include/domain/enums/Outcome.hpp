#pragma once

#include "Action.hpp"
#include <string>
#include <stdexcept>

namespace arena::domain {

/**
 * @brief Исход раунда с точки зрения игрока
 */
enum class Outcome {
    WIN,
    TIE,
    LOSE
};

inline std::string toString(Outcome outcome) {
    switch (outcome) {
        case Outcome::WIN:  return "WIN";
        case Outcome::TIE:  return "TIE";
        case Outcome::LOSE: return "LOSE";
    }
    return "UNKNOWN";
}

inline Outcome outcomeFromString(const std::string& str) {
    if (str == "WIN")  return Outcome::WIN;
    if (str == "TIE")  return Outcome::TIE;
    if (str == "LOSE") return Outcome::LOSE;
    throw std::invalid_argument("Unknown Outcome: " + str);
}

/**
 * @brief Разрешить раунд по фиксированным правилам
 */
constexpr Outcome resolveOutcome(Action player, Action opponent) {
    if (player == opponent) return Outcome::TIE;
    return beats(player, opponent) ? Outcome::WIN : Outcome::LOSE;
}

} // namespace arena::domain
