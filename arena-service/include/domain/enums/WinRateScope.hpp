#pragma once

#include <string>
#include <stdexcept>

namespace arena::domain {

/**
 * @brief По какой выборке WinRateController считает фактический win rate
 */
enum class WinRateScope {
    PER_ACCOUNT,  ///< Отдельная статистика на каждый аккаунт
    PLATFORM      ///< Общая статистика по всей платформе
};

inline std::string toString(WinRateScope scope) {
    switch (scope) {
        case WinRateScope::PER_ACCOUNT: return "PER_ACCOUNT";
        case WinRateScope::PLATFORM:    return "PLATFORM";
    }
    return "UNKNOWN";
}

inline WinRateScope winRateScopeFromString(const std::string& str) {
    if (str == "PER_ACCOUNT") return WinRateScope::PER_ACCOUNT;
    if (str == "PLATFORM")    return WinRateScope::PLATFORM;
    throw std::invalid_argument("Unknown WinRateScope: " + str);
}

} // namespace arena::domain
