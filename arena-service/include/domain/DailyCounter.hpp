#pragma once

#include "CheckedMath.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Счётчики участия аккаунта за сутки UTC
 *
 * Создаются лениво; отсутствие записи за день равно нулевым счётчикам.
 */
struct DailyCounter {
    std::string accountId;
    DayKey day = 0;
    int64_t roundsPlayed = 0;
    Credits creditsWagered = 0;
};

} // namespace arena::domain
