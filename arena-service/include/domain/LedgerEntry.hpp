#pragma once

#include "CheckedMath.hpp"
#include "Timestamp.hpp"
#include "enums/LedgerReason.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Запись аудита Ledger (одна на каждое изменение баланса)
 */
struct LedgerEntry {
    uint64_t id = 0;                 ///< Глобальный порядковый номер
    std::string accountId;
    EntryDirection direction = EntryDirection::CREDIT;
    LedgerReason reason = LedgerReason::PURCHASE;
    std::string reference;           ///< ID матча или операции кошелька
    Credits amount = 0;
    Credits balanceAfter = 0;
    Timestamp timestamp;
};

/**
 * @brief Агрегаты Ledger для сверки
 *
 * purchased − cashedOut − lostStakes + winPremiums == balances
 */
struct LedgerTotals {
    Credits purchased = 0;    ///< Σ покупок
    Credits cashedOut = 0;    ///< Σ выводов
    Credits lostStakes = 0;   ///< Σ проигранных ставок (доход платформы)
    Credits winPremiums = 0;  ///< Σ (выплата − ставка) по выигрышам
    Credits balances = 0;     ///< Σ текущих балансов

    Credits houseEarnings() const {
        return lostStakes - winPremiums;
    }

    bool reconciles() const {
        return purchased - cashedOut - lostStakes + winPremiums == balances;
    }
};

} // namespace arena::domain
