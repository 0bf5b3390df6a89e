#pragma once

#include "domain/WalletOperation.hpp"
#include "domain/LedgerEntry.hpp"
#include <string>
#include <vector>

namespace arena::ports::input {

/**
 * @brief Интерфейс покупки и вывода кредитов
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    /**
     * @brief Купить кредиты за внешний актив
     *
     * @param assetAmount Сумма актива в минимальных единицах
     * @return Операция; credits - начисленные кредиты (округление вниз)
     */
    virtual domain::WalletOperation purchase(
        const std::string& accountId,
        const std::string& assetId,
        int64_t assetAmount
    ) = 0;

    /**
     * @brief Вывести кредиты во внешний актив
     *
     * @return Операция; assetAmount - сумма к выплате (округление вниз)
     */
    virtual domain::WalletOperation cashout(
        const std::string& accountId,
        const std::string& assetId,
        domain::Credits credits
    ) = 0;

    /**
     * @brief Сколько актива нужно заплатить за credits (округление вверх)
     */
    virtual int64_t quotePurchase(const std::string& assetId, domain::Credits credits) = 0;

    virtual domain::Credits getBalance(const std::string& accountId) = 0;

    virtual std::vector<domain::LedgerEntry> getLedgerEntries(const std::string& accountId) = 0;

    virtual std::vector<domain::WalletOperation> getWalletOperations(const std::string& accountId) = 0;
};

} // namespace arena::ports::input
