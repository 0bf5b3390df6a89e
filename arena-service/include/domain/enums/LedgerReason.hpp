#pragma once

#include <string>

namespace arena::domain {

/**
 * @brief Причина изменения баланса (для аудита и сверки)
 */
enum class LedgerReason {
    PURCHASE,   ///< Покупка кредитов за внешний актив
    CASHOUT,    ///< Вывод кредитов во внешний актив
    STAKE,      ///< Списание ставки раунда
    PAYOUT      ///< Выплата по раунду (выигрыш или возврат при ничьей)
};

inline std::string toString(LedgerReason reason) {
    switch (reason) {
        case LedgerReason::PURCHASE: return "PURCHASE";
        case LedgerReason::CASHOUT:  return "CASHOUT";
        case LedgerReason::STAKE:    return "STAKE";
        case LedgerReason::PAYOUT:   return "PAYOUT";
    }
    return "UNKNOWN";
}

enum class EntryDirection {
    CREDIT,
    DEBIT
};

inline std::string toString(EntryDirection direction) {
    return direction == EntryDirection::CREDIT ? "CREDIT" : "DEBIT";
}

} // namespace arena::domain
