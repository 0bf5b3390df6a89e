#pragma once

#include "domain/ArenaConfig.hpp"
#include <functional>
#include <mutex>
#include <shared_mutex>

namespace arena::application {

/**
 * @brief Живая runtime-конфигурация платформы
 *
 * Заполняется из ArenaSettings при старте, дальше меняется только
 * через AdminService. Читатели получают снимок по значению.
 */
class ConfigRegistry {
public:
    ConfigRegistry() = default;

    explicit ConfigRegistry(const domain::ArenaConfig& initial) : config_(initial) {}

    domain::ArenaConfig get() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return config_;
    }

    /**
     * @brief Атомарно изменить конфигурацию
     */
    void update(const std::function<void(domain::ArenaConfig&)>& mutator) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        mutator(config_);
    }

    bool isPaused() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return config_.paused;
    }

    void setPaused(bool paused) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        config_.paused = paused;
    }

private:
    mutable std::shared_mutex mutex_;
    domain::ArenaConfig config_;
};

} // namespace arena::application
