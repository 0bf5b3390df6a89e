#pragma once

#include <string>

namespace arena::ports::output {

/**
 * @brief Интерфейс издателя событий
 *
 * Строковый интерфейс (routingKey + message) для совместимости
 * с брокерами сообщений.
 *
 * @example
 * ```cpp
 * publisher->publish("arena.round", R"({"offset":7,"sequenceNumber":3,...})");
 * ```
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации ("arena.purchase", "arena.round", "arena.cashout")
     * @param message JSON записи журнала событий
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace arena::ports::output
