#pragma once

#include "CheckedMath.hpp"
#include "enums/Difficulty.hpp"
#include "enums/WinRateScope.hpp"
#include <chrono>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Снимок runtime-конфигурации платформы
 *
 * Значения по умолчанию совпадают с дефолтами ArenaSettings.
 */
struct ArenaConfig {
    int64_t maxDailyRounds = 10;
    Credits maxDailyWager = 10'000;
    int64_t winMultiplierBps = 12'500;      ///< 12500 = 125%
    double targetWinRate = 0.75;            ///< Целевая доля побед соперника
    std::size_t historyWindow = 10;         ///< Окно MoveHistory
    WinRateScope winRateScope = WinRateScope::PER_ACCOUNT;
    std::size_t winRateWindow = 50;         ///< Скользящее окно WinRateController
    std::chrono::seconds maxPriceAge{300};
    std::chrono::milliseconds oracleTimeout{2000};
    Difficulty defaultDifficulty = Difficulty::HARD;
    bool paused = false;
};

} // namespace arena::domain
