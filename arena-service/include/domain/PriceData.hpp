#pragma once

#include "Timestamp.hpp"
#include <cstdint>

namespace arena::domain {

/**
 * @brief Цена актива от оракула в фиксированной точке
 *
 * price - стоимость одного целого актива в кредитах, умноженная на
 * 10^precision. Пример: 1 ETH = 3000.5 кредита → {price: 30005, precision: 1}.
 */
struct PriceData {
    int64_t price = 0;
    int precision = 0;
    Timestamp observedAt;

    PriceData() = default;

    PriceData(int64_t price, int precision, const Timestamp& observedAt)
        : price(price), precision(precision), observedAt(observedAt) {}
};

} // namespace arena::domain
