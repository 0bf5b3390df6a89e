#pragma once

#include "domain/Timestamp.hpp"

namespace arena::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Все суточные ключи и метки времени берутся отсюда, чтобы тесты
 * могли проверять границы суток.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() = 0;
};

} // namespace arena::ports::output
