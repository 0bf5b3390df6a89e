#pragma once

#include "application/AssetRegistry.hpp"
#include "application/ConfigRegistry.hpp"
#include "application/PriceFetchWorker.hpp"
#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IClock.hpp"
#include "domain/CheckedMath.hpp"
#include "domain/PriceData.hpp"
#include "domain/SupportedAsset.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace arena::application {

/**
 * @brief Цены активов и конвертация кредиты <-> актив
 *
 * Оборачивает внешний IPriceOracle:
 * - проверяет, что актив зарегистрирован и активен;
 * - ограничивает ожидание ответа таймаутом из конфигурации
 *   (запросы идут через один PriceFetchWorker);
 * - отбрасывает устаревшие цены (старше maxPriceAge).
 *
 * Конвертация только целочисленная. Пусть S = 10^(decimals + precision):
 * - credits -> asset: credits * S / price
 * - asset -> credits: asset * price / S
 *
 * Rounding::UP - для суммы, которую платит пользователь,
 * Rounding::DOWN - для суммы, которую платит платформа.
 *
 * @example
 * ```cpp
 * // USDC: decimals=6, цена 1 USDC = 1.00 кредита -> {price: 100, precision: 2}
 * auto price = oracle.getPrice("USDC");
 * auto units = PricingOracle::creditsToAssetAmount(usdc, price, 25, Rounding::UP);  // 25'000'000
 * ```
 */
class PricingOracle {
public:
    PricingOracle(
        std::shared_ptr<ports::output::IPriceOracle> oracle,
        std::shared_ptr<AssetRegistry> assets,
        std::shared_ptr<ConfigRegistry> config,
        std::shared_ptr<ports::output::IClock> clock
    );

    /**
     * @brief Актив, доступный для операций
     * @throws ArenaException(AssetNotSupported | AssetInactive)
     */
    domain::SupportedAsset requireActiveAsset(const std::string& assetId) const;

    /**
     * @brief Свежая цена актива
     *
     * @throws ArenaException(AssetNotSupported | AssetInactive | OracleUnavailable | StalePrice)
     */
    domain::PriceData getPrice(const std::string& assetId);

    domain::PriceData getPrice(const domain::SupportedAsset& asset);

    int64_t creditsToAssetAmount(const std::string& assetId, domain::Credits credits, domain::Rounding rounding);

    domain::Credits assetAmountToCredits(const std::string& assetId, int64_t assetAmount, domain::Rounding rounding);

    static int64_t creditsToAssetAmount(const domain::SupportedAsset& asset, const domain::PriceData& price,
                                        domain::Credits credits, domain::Rounding rounding);

    static domain::Credits assetAmountToCredits(const domain::SupportedAsset& asset, const domain::PriceData& price,
                                                int64_t assetAmount, domain::Rounding rounding);

    /**
     * @brief Максимальное расхождение round trip credits -> asset -> credits
     *
     * Стоимость одной минимальной единицы актива в кредитах, не меньше 1.
     */
    static domain::Credits roundTripTolerance(const domain::SupportedAsset& asset, const domain::PriceData& price);

    /**
     * @throws ArenaException(PurchaseOutOfBounds) если сумма вне [minPurchase, maxPurchase]
     */
    static void checkPurchaseBounds(const domain::SupportedAsset& asset, int64_t assetAmount);

private:
    std::shared_ptr<AssetRegistry> assets_;
    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::unique_ptr<PriceFetchWorker> fetcher_;

    static int64_t scaleOf(const domain::SupportedAsset& asset, const domain::PriceData& price);
};

} // namespace arena::application
