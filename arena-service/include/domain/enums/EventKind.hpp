#pragma once

#include <string>
#include <stdexcept>

namespace arena::domain {

/**
 * @brief Тип записи в журнале событий
 */
enum class EventKind {
    PURCHASE,
    ROUND,
    CASHOUT
};

inline std::string toString(EventKind kind) {
    switch (kind) {
        case EventKind::PURCHASE: return "purchase";
        case EventKind::ROUND:    return "round";
        case EventKind::CASHOUT:  return "cashout";
    }
    return "unknown";
}

inline EventKind eventKindFromString(const std::string& str) {
    if (str == "purchase") return EventKind::PURCHASE;
    if (str == "round")    return EventKind::ROUND;
    if (str == "cashout")  return EventKind::CASHOUT;
    throw std::invalid_argument("Unknown EventKind: " + str);
}

/**
 * @brief Routing key для внешней шины ("arena.round" и т.д.)
 */
inline std::string routingKeyFor(EventKind kind) {
    return "arena." + toString(kind);
}

} // namespace arena::domain
