#pragma once

#include <stdexcept>
#include <string>

namespace arena::domain {

/**
 * @brief Коды ожидаемых (восстановимых) ошибок
 *
 * Каждая такая ошибка возвращается вызывающему синхронно и гарантирует,
 * что операция не оставила частичных изменений.
 */
enum class ErrorCode {
    InvalidInput,
    InvalidStake,
    InsufficientBalance,
    DailyRoundLimitExceeded,
    DailyWagerLimitExceeded,
    Unverified,
    AssetNotSupported,
    AssetInactive,
    OracleUnavailable,
    StalePrice,
    SystemPaused,
    PurchaseOutOfBounds
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidInput:            return "INVALID_INPUT";
        case ErrorCode::InvalidStake:            return "INVALID_STAKE";
        case ErrorCode::InsufficientBalance:     return "INSUFFICIENT_BALANCE";
        case ErrorCode::DailyRoundLimitExceeded: return "DAILY_ROUND_LIMIT_EXCEEDED";
        case ErrorCode::DailyWagerLimitExceeded: return "DAILY_WAGER_LIMIT_EXCEEDED";
        case ErrorCode::Unverified:              return "UNVERIFIED";
        case ErrorCode::AssetNotSupported:       return "ASSET_NOT_SUPPORTED";
        case ErrorCode::AssetInactive:           return "ASSET_INACTIVE";
        case ErrorCode::OracleUnavailable:       return "ORACLE_UNAVAILABLE";
        case ErrorCode::StalePrice:              return "STALE_PRICE";
        case ErrorCode::SystemPaused:            return "SYSTEM_PAUSED";
        case ErrorCode::PurchaseOutOfBounds:     return "PURCHASE_OUT_OF_BOUNDS";
    }
    return "UNKNOWN";
}

/**
 * @brief Исключение для ожидаемых ошибок пользователя/окружения
 */
class ArenaException : public std::runtime_error {
public:
    ArenaException(ErrorCode code, const std::string& message)
        : std::runtime_error(toString(code) + ": " + message)
        , code_(code)
    {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Нарушение инварианта (переполнение, отрицательный баланс)
 *
 * Дефект, а не ошибка пользователя: операция прерывается, вызывающий
 * не должен трактовать это как отказ валидации.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::logic_error("Invariant violation: " + message) {}
};

} // namespace arena::domain
