#pragma once

#include "DomainEvent.hpp"
#include "domain/Match.hpp"
#include <string>

namespace arena::domain {

/**
 * @brief Событие: раунд разрешён и выплата проведена
 */
struct RoundSettledEvent : public DomainEvent {
    Match match;

    RoundSettledEvent() : DomainEvent("round.settled") {}

    explicit RoundSettledEvent(const Match& m) : DomainEvent("round.settled"), match(m) {
        timestamp = m.timestamp;
    }

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<RoundSettledEvent>(*this);
    }
};

} // namespace arena::domain
