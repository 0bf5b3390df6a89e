#pragma once

#include <string>

namespace arena::domain {

/**
 * @brief Состояние раунда в MatchSettlementEngine
 *
 * INITIATED → LIMIT_RESERVED → STAKE_DEBITED → OPPONENT_MOVED → RESOLVED.
 * ABORTED - откат к состоянию до INITIATED.
 */
enum class RoundState {
    INITIATED,
    LIMIT_RESERVED,
    STAKE_DEBITED,
    OPPONENT_MOVED,
    RESOLVED,
    ABORTED
};

inline std::string toString(RoundState state) {
    switch (state) {
        case RoundState::INITIATED:      return "INITIATED";
        case RoundState::LIMIT_RESERVED: return "LIMIT_RESERVED";
        case RoundState::STAKE_DEBITED:  return "STAKE_DEBITED";
        case RoundState::OPPONENT_MOVED: return "OPPONENT_MOVED";
        case RoundState::RESOLVED:       return "RESOLVED";
        case RoundState::ABORTED:        return "ABORTED";
    }
    return "UNKNOWN";
}

} // namespace arena::domain
