#pragma once

#include "ports/output/IClock.hpp"
#include <mutex>

namespace arena::tests {

/**
 * @brief Управляемые часы для тестов границ суток
 */
class FakeClock : public ports::output::IClock {
public:
    explicit FakeClock(int64_t unixMillis = 1'765'929'600'000)  // 2025-12-17T00:00:00.000Z
        : now_(domain::Timestamp::fromUnixMillis(unixMillis)) {}

    domain::Timestamp now() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void set(const domain::Timestamp& t) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = t;
    }

    void setUnixMillis(int64_t millis) {
        set(domain::Timestamp::fromUnixMillis(millis));
    }

    void advanceMillis(int64_t millis) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addMillis(millis);
    }

private:
    std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace arena::tests
