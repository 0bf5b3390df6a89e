#pragma once

#include <string>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Внешний актив, за который можно купить кредиты
 *
 * Суммы актива хранятся в минимальных единицах (10^-decimals целого актива).
 *
 * @example
 * ```
 * SupportedAsset usdc{"USDC", "feed-usdc", 6, 1'000'000, 10'000'000'000, true};
 * // 1 USDC = 1'000'000 единиц, покупка от 1 до 10'000 USDC
 * ```
 */
struct SupportedAsset {
    std::string id;             ///< Идентификатор актива ("ETH", "USDC")
    std::string priceFeedId;    ///< Ссылка на ценовой фид оракула
    int decimals = 0;           ///< Точность минимальной единицы (0..18)
    int64_t minPurchase = 0;    ///< Минимальная сумма операции (мин. единицы)
    int64_t maxPurchase = 0;    ///< Максимальная сумма операции (мин. единицы)
    bool active = true;

    SupportedAsset() = default;

    SupportedAsset(const std::string& id, const std::string& priceFeedId, int decimals,
                   int64_t minPurchase, int64_t maxPurchase, bool active = true)
        : id(id), priceFeedId(priceFeedId), decimals(decimals),
          minPurchase(minPurchase), maxPurchase(maxPurchase), active(active) {}
};

} // namespace arena::domain
