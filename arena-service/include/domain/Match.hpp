#pragma once

#include "CheckedMath.hpp"
#include "Timestamp.hpp"
#include "enums/Action.hpp"
#include "enums/Outcome.hpp"
#include "enums/Difficulty.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Неизменяемая запись о разрешённом раунде
 *
 * Создаётся один раз на раунд, никогда не изменяется и не удаляется.
 */
struct Match {
    std::string id;
    std::string accountId;
    uint64_t sequence = 0;          ///< Номер раунда аккаунта (с 1)
    Action playerAction = Action::ROCK;
    Action opponentAction = Action::ROCK;
    Outcome outcome = Outcome::TIE;
    Difficulty difficulty = Difficulty::HARD;
    Credits stake = 0;
    Credits payout = 0;
    Credits balanceAfter = 0;
    Timestamp timestamp;

    bool opponentWon() const {
        return outcome == Outcome::LOSE;
    }
};

} // namespace arena::domain
