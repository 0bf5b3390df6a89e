#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace arena::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Сериализованное событие становится payload записи EventLog.
 */
struct DomainEvent {
    std::string eventType;      ///< Тип события (round.settled, credits.purchased)
    Timestamp timestamp;        ///< Время события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace arena::domain
