#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <iostream>
#include <mutex>

namespace arena::adapters::secondary {

/**
 * @brief Публикация событий в stdout
 *
 * Используется arena-sim вместо брокера сообщений.
 */
class ConsoleEventPublisher : public ports::output::IEventPublisher {
public:
    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[Event] " << routingKey << " " << message << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace arena::adapters::secondary
