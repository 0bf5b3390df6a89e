#pragma once

#include "DomainEvent.hpp"
#include "domain/WalletOperation.hpp"
#include <string>

namespace arena::domain {

/**
 * @brief Событие: кредиты куплены за внешний актив
 */
struct CreditsPurchasedEvent : public DomainEvent {
    WalletOperation operation;
    Credits balanceAfter = 0;

    CreditsPurchasedEvent() : DomainEvent("credits.purchased") {}

    CreditsPurchasedEvent(const WalletOperation& op, Credits balance)
        : DomainEvent("credits.purchased"), operation(op), balanceAfter(balance) {
        timestamp = op.timestamp;
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CreditsPurchasedEvent>(*this);
    }
};

/**
 * @brief Событие: кредиты выведены во внешний актив
 */
struct CreditsCashedOutEvent : public DomainEvent {
    WalletOperation operation;
    Credits balanceAfter = 0;

    CreditsCashedOutEvent() : DomainEvent("credits.cashed_out") {}

    CreditsCashedOutEvent(const WalletOperation& op, Credits balance)
        : DomainEvent("credits.cashed_out"), operation(op), balanceAfter(balance) {
        timestamp = op.timestamp;
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<CreditsCashedOutEvent>(*this);
    }
};

} // namespace arena::domain
