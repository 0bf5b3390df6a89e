#pragma once

#include "ports/input/IAdminService.hpp"
#include "application/AssetRegistry.hpp"
#include "application/ConfigRegistry.hpp"
#include "application/Ledger.hpp"
#include "domain/ArenaError.hpp"
#include <iostream>
#include <memory>

namespace arena::application {

/**
 * @brief Административные операции: активы, пауза, константы
 */
class AdminService : public ports::input::IAdminService {
public:
    AdminService(
        std::shared_ptr<AssetRegistry> assets,
        std::shared_ptr<ConfigRegistry> config,
        std::shared_ptr<Ledger> ledger
    ) : assets_(std::move(assets))
      , config_(std::move(config))
      , ledger_(std::move(ledger))
    {}

    void registerAsset(const domain::SupportedAsset& asset) override {
        assets_->registerAsset(asset);
    }

    void deactivateAsset(const std::string& assetId) override {
        assets_->deactivate(assetId);
    }

    void activateAsset(const std::string& assetId) override {
        assets_->activate(assetId);
    }

    std::vector<domain::SupportedAsset> listAssets() override {
        return assets_->list();
    }

    void setPaused(bool paused) override {
        config_->setPaused(paused);
        std::cout << "[AdminService] System " << (paused ? "paused" : "resumed") << std::endl;
    }

    void setMaxDailyRounds(int64_t rounds) override {
        require(rounds > 0, "max daily rounds must be positive");
        config_->update([rounds](auto& cfg) { cfg.maxDailyRounds = rounds; });
        log("maxDailyRounds", std::to_string(rounds));
    }

    void setMaxDailyWager(domain::Credits wager) override {
        require(wager > 0, "max daily wager must be positive");
        config_->update([wager](auto& cfg) { cfg.maxDailyWager = wager; });
        log("maxDailyWager", std::to_string(wager));
    }

    void setWinMultiplierBps(int64_t bps) override {
        require(bps >= 10'000 && bps <= 1'000'000, "win multiplier must be in [10000, 1000000] bps");
        config_->update([bps](auto& cfg) { cfg.winMultiplierBps = bps; });
        log("winMultiplierBps", std::to_string(bps));
    }

    void setTargetWinRate(double rate) override {
        require(rate > 1.0 / 3.0 && rate < 1.0, "target win rate must be in (1/3, 1)");
        config_->update([rate](auto& cfg) { cfg.targetWinRate = rate; });
        log("targetWinRate", std::to_string(rate));
    }

    void setHistoryWindow(std::size_t window) override {
        require(window > 0 && window <= 1000, "history window must be in [1, 1000]");
        config_->update([window](auto& cfg) { cfg.historyWindow = window; });
        log("historyWindow", std::to_string(window));
    }

    void setWinRateScope(domain::WinRateScope scope) override {
        config_->update([scope](auto& cfg) { cfg.winRateScope = scope; });
        log("winRateScope", domain::toString(scope));
    }

    domain::ArenaConfig getConfig() override {
        return config_->get();
    }

    domain::LedgerTotals getHouseReport() override {
        return ledger_->totals();
    }

private:
    std::shared_ptr<AssetRegistry> assets_;
    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<Ledger> ledger_;

    static void require(bool condition, const std::string& message) {
        if (!condition) {
            throw domain::ArenaException(domain::ErrorCode::InvalidInput, message);
        }
    }

    static void log(const std::string& key, const std::string& value) {
        std::cout << "[AdminService] " << key << " = " << value << std::endl;
    }
};

} // namespace arena::application
