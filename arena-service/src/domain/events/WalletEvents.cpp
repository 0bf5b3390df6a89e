#include "domain/events/WalletEvents.hpp"
#include <nlohmann/json.hpp>

namespace arena::domain {

namespace {

nlohmann::json operationToJson(const WalletOperation& op) {
    nlohmann::json j;
    j["operationId"] = op.id;
    j["accountId"] = op.accountId;
    j["assetId"] = op.assetId;
    j["assetAmount"] = op.assetAmount;
    j["credits"] = op.credits;
    j["price"] = {
        {"value", op.price.price},
        {"precision", op.price.precision},
        {"observedAt", op.price.observedAt.toString()}
    };
    return j;
}

} // namespace

std::string CreditsPurchasedEvent::toJson() const {
    nlohmann::json j = operationToJson(operation);
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["balanceAfter"] = balanceAfter;
    return j.dump();
}

std::string CreditsCashedOutEvent::toJson() const {
    nlohmann::json j = operationToJson(operation);
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["balanceAfter"] = balanceAfter;
    return j.dump();
}

} // namespace arena::domain
