#pragma once

#include "CheckedMath.hpp"
#include "PriceData.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

enum class WalletOperationKind {
    PURCHASE,
    CASHOUT
};

inline std::string toString(WalletOperationKind kind) {
    return kind == WalletOperationKind::PURCHASE ? "PURCHASE" : "CASHOUT";
}

/**
 * @brief Неизменяемая запись о покупке или выводе кредитов
 */
struct WalletOperation {
    std::string id;
    std::string accountId;
    WalletOperationKind kind = WalletOperationKind::PURCHASE;
    std::string assetId;
    int64_t assetAmount = 0;    ///< Сумма актива в минимальных единицах
    Credits credits = 0;
    PriceData price;            ///< Цена, по которой проведена операция
    Timestamp timestamp;
};

} // namespace arena::domain
