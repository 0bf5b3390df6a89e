#pragma once

#include "CheckedMath.hpp"
#include "Timestamp.hpp"
#include <string>

namespace arena::domain {

/**
 * @brief Кредитный счёт игрока
 *
 * Принадлежит Ledger: любое изменение баланса проходит только через него.
 */
struct Account {
    std::string id;             ///< Идентификатор аккаунта
    Credits creditBalance = 0;  ///< Баланс в минимальных единицах (>= 0)
    DayKey lastKnownDay = 0;    ///< Сутки UTC последнего изменения
    Timestamp createdAt;        ///< Дата создания

    Account() = default;

    Account(const std::string& id, const Timestamp& createdAt)
        : id(id), creditBalance(0), lastKnownDay(createdAt.utcDayKey()), createdAt(createdAt) {}
};

} // namespace arena::domain
