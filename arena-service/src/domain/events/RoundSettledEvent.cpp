#include "domain/events/RoundSettledEvent.hpp"
#include <nlohmann/json.hpp>

namespace arena::domain {

std::string RoundSettledEvent::toJson() const {
    nlohmann::json j;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["matchId"] = match.id;
    j["accountId"] = match.accountId;
    j["sequence"] = match.sequence;
    j["playerAction"] = toString(match.playerAction);
    j["opponentAction"] = toString(match.opponentAction);
    j["outcome"] = toString(match.outcome);
    j["difficulty"] = toString(match.difficulty);
    j["stake"] = match.stake;
    j["payout"] = match.payout;
    j["balanceAfter"] = match.balanceAfter;
    return j.dump();
}

} // namespace arena::domain
