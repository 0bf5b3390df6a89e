#pragma once

#include "domain/ArenaConfig.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/SupportedAsset.hpp"
#include <string>
#include <vector>

namespace arena::ports::input {

/**
 * @brief Административные операции платформы
 *
 * Авторизация администратора выполняется снаружи.
 * Все сеттеры бросают ArenaException(InvalidInput) на недопустимое значение.
 */
class IAdminService {
public:
    virtual ~IAdminService() = default;

    virtual void registerAsset(const domain::SupportedAsset& asset) = 0;
    virtual void deactivateAsset(const std::string& assetId) = 0;
    virtual void activateAsset(const std::string& assetId) = 0;
    virtual std::vector<domain::SupportedAsset> listAssets() = 0;

    virtual void setPaused(bool paused) = 0;
    virtual void setMaxDailyRounds(int64_t rounds) = 0;
    virtual void setMaxDailyWager(domain::Credits wager) = 0;
    virtual void setWinMultiplierBps(int64_t bps) = 0;
    virtual void setTargetWinRate(double rate) = 0;
    virtual void setHistoryWindow(std::size_t window) = 0;
    virtual void setWinRateScope(domain::WinRateScope scope) = 0;

    virtual domain::ArenaConfig getConfig() = 0;

    /**
     * @brief Сводка Ledger: покупки, выводы, доход платформы, сверка
     */
    virtual domain::LedgerTotals getHouseReport() = 0;
};

} // namespace arena::ports::input
