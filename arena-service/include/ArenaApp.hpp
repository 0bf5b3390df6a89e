#pragma once

#include <memory>
#include <string>

// Forward declarations - Ports
namespace arena::ports::input {
    class IMatchService;
    class IWalletService;
    class IAdminService;
}

namespace arena::settings {
    class ArenaSettings;
}

namespace arena::adapters::secondary {
    class AllowListVerificationProvider;
}

/**
 * @class ArenaApp
 * @brief Симулятор Stake Arena
 *
 * Порядок работы run():
 * 1. loadEnvironment() - ArenaSettings из ENV и ARENA_CONFIG_FILE
 * 2. configureInjection() - Boost.DI: порты -> адаптеры и сервисы
 * 3. runSimulation() - покупка кредитов и раунды для симулированных игроков
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: FixedPriceOracle, AllowList, InMemory*, ConsoleEventPublisher
 * - Application: MatchSettlementEngine, WalletService, AdminService
 */
class ArenaApp
{
public:
    ArenaApp();
    ~ArenaApp();

    /**
     * @return Код возврата процесса
     */
    int run(int argc, char* argv[]);

private:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void runSimulation();
    void printStartupBanner();
    void printHouseReport();

    std::shared_ptr<arena::settings::ArenaSettings> settings_;
    std::shared_ptr<arena::adapters::secondary::AllowListVerificationProvider> verification_;
    std::shared_ptr<arena::ports::input::IMatchService> matchService_;
    std::shared_ptr<arena::ports::input::IWalletService> walletService_;
    std::shared_ptr<arena::ports::input::IAdminService> adminService_;
};
