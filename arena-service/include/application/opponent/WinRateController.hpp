#pragma once

#include "application/ConfigRegistry.hpp"
#include "domain/WinRateStats.hpp"
#include "ThreadSafeMap.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace arena::application::opponent {

/**
 * @brief Отслеживание фактического win rate соперника и расчёт bias
 *
 * Статистика ведётся одновременно по аккаунтам и по платформе;
 * какая из них используется, решает winRateScope в конфигурации.
 */
class WinRateController {
public:
    static constexpr double PROPORTIONAL_GAIN = 2.0;
    static constexpr double INTEGRAL_GAIN = 0.1;

    explicit WinRateController(std::shared_ptr<ConfigRegistry> config)
        : config_(std::move(config)) {}

    /**
     * @brief Статистика для аккаунта с учётом текущего scope
     */
    domain::WinRateStats statsFor(const std::string& accountId) const;

    /**
     * @brief Учесть исход закоммиченного раунда
     */
    void record(const std::string& accountId, bool opponentWon);

    /**
     * @brief Смещение стратегии в [-1, 1]
     *
     * bias = Kp * (target - rollingRate) + Ki * (target * rounds - wins)
     *
     * > 0 - соперник недобирает до цели, < 0 - перебирает, 0 - на цели
     * (и при пустой статистике).
     */
    static double bias(const domain::WinRateStats& stats, double target);

private:
    struct StatsSlot {
        mutable std::mutex mutex;
        domain::WinRateStats stats;
    };

    std::shared_ptr<ConfigRegistry> config_;
    ThreadSafeMap<std::string, StatsSlot> perAccount_;
    StatsSlot platform_;

    static void recordInto(StatsSlot& slot, bool opponentWon, std::size_t window);
};

} // namespace arena::application::opponent
