#pragma once

#include "CheckedMath.hpp"
#include "enums/Action.hpp"
#include "enums/Outcome.hpp"
#include "enums/RoundState.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Результат playRound
 */
struct RoundResult {
    std::string matchId;
    uint64_t sequence = 0;
    Action playerAction = Action::ROCK;
    Action opponentAction = Action::ROCK;
    Outcome outcome = Outcome::TIE;
    Credits stake = 0;
    Credits payout = 0;
    Credits balanceAfter = 0;
    RoundState state = RoundState::INITIATED;
};

} // namespace arena::domain
