#pragma once

#include "Timestamp.hpp"
#include "enums/EventKind.hpp"
#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Неизменяемая запись журнала событий
 *
 * offset - глобальный порядок; sequenceNumber - строго возрастающий
 * номер в пределах аккаунта (с 1).
 */
struct EventLogEntry {
    uint64_t offset = 0;
    uint64_t sequenceNumber = 0;
    std::string accountId;
    EventKind kind = EventKind::ROUND;
    std::string referenceId;    ///< ID Match или WalletOperation
    std::string payload;        ///< JSON доменного события
    Timestamp timestamp;

    std::string toJson() const;
};

} // namespace arena::domain
