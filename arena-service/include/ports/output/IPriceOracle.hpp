#pragma once

#include "domain/PriceData.hpp"
#include <string>

namespace arena::ports::output {

/**
 * @brief Внешний источник цен активов
 *
 * Реализации:
 * - FixedPriceOracle - цены из конфигурации (симулятор)
 * - MockPriceOracle - тесты
 *
 * Вызов может блокироваться на сетевом обмене, поэтому PricingOracle
 * вызывает его вне блокировки аккаунта и с таймаутом.
 */
class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    /**
     * @brief Получить последнюю цену по фиду
     * @param priceFeedId Идентификатор ценового фида актива
     * @throws std::exception при сбое транспорта
     */
    virtual domain::PriceData getPrice(const std::string& priceFeedId) = 0;
};

} // namespace arena::ports::output
