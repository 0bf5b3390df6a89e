#include "ArenaApp.hpp"

// Application Services
#include "application/AdminService.hpp"
#include "application/MatchSettlementEngine.hpp"
#include "application/WalletService.hpp"
#include "application/opponent/AIOpponent.hpp"

// Secondary Adapters
#include "adapters/secondary/events/ConsoleEventPublisher.hpp"
#include "adapters/secondary/oracle/FixedPriceOracle.hpp"
#include "adapters/secondary/persistence/InMemoryMatchRepository.hpp"
#include "adapters/secondary/persistence/InMemoryWalletOperationRepository.hpp"
#include "adapters/secondary/system/SecureRandomSource.hpp"
#include "adapters/secondary/system/SystemClock.hpp"
#include "adapters/secondary/verification/AllowListVerificationProvider.hpp"

#include "settings/ArenaSettings.hpp"
#include "domain/ArenaError.hpp"

#include <boost/di.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <random>

namespace di = boost::di;

using namespace arena;

namespace {

// Активы по умолчанию, если конфигурация их не задаёт
const domain::SupportedAsset DEFAULT_ASSET{"USDC", "feed-usdc", 6, 1'000'000, 10'000'000'000};
constexpr int64_t DEFAULT_PRICE = 100;      // 1 USDC = 1.00 кредита
constexpr int DEFAULT_PRECISION = 2;

enum class PlayerStyle { CONSTANT, CYCLIC, RANDOM };

std::string toString(PlayerStyle style) {
    switch (style) {
        case PlayerStyle::CONSTANT: return "CONSTANT";
        case PlayerStyle::CYCLIC:   return "CYCLIC";
        case PlayerStyle::RANDOM:   return "RANDOM";
    }
    return "UNKNOWN";
}

domain::Action nextMove(PlayerStyle style, int round, std::mt19937& rng) {
    switch (style) {
        case PlayerStyle::CONSTANT:
            return domain::Action::ROCK;
        case PlayerStyle::CYCLIC:
            return domain::ALL_ACTIONS[static_cast<std::size_t>(round) % domain::ACTION_COUNT];
        case PlayerStyle::RANDOM:
            break;
    }
    std::uniform_int_distribution<std::size_t> dist(0, domain::ACTION_COUNT - 1);
    return domain::ALL_ACTIONS[dist(rng)];
}

} // namespace

// ============================================================================
// ArenaApp Implementation
// ============================================================================

ArenaApp::ArenaApp()
{
    std::cout << "[ArenaApp] Application created" << std::endl;
}

ArenaApp::~ArenaApp()
{
    std::cout << "[ArenaApp] Application destroyed" << std::endl;
}

int ArenaApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    runSimulation();
    printHouseReport();
    return 0;
}

void ArenaApp::loadEnvironment(int argc, char* argv[])
{
    (void)argc;
    (void)argv;
    std::cout << "[ArenaApp] Loading environment..." << std::endl;
    settings_ = std::make_shared<settings::ArenaSettings>();
    std::cout << "[ArenaApp] Environment loaded successfully" << std::endl;
}

void ArenaApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[ArenaApp] Configuring Boost.DI injection..." << std::endl;

    verification_ = std::make_shared<adapters::secondary::AllowListVerificationProvider>();
    auto configRegistry = std::make_shared<application::ConfigRegistry>(settings_->getConfig());

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<settings::ArenaSettings>().to(settings_),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::IRandomSource>()
            .to<adapters::secondary::SecureRandomSource>()
            .in(di::singleton),

        // Оракул с ценами из конфигурации
        di::bind<ports::output::IPriceOracle>()
            .to<adapters::secondary::FixedPriceOracle>()
            .in(di::singleton),

        di::bind<ports::output::IVerificationProvider>().to(verification_),

        di::bind<ports::output::IEventPublisher>()
            .to<adapters::secondary::ConsoleEventPublisher>()
            .in(di::singleton),

        di::bind<ports::output::IOpponentStrategy>()
            .to<application::opponent::AIOpponent>()
            .in(di::singleton),

        di::bind<ports::output::IMatchRepository>()
            .to<adapters::secondary::InMemoryMatchRepository>()
            .in(di::singleton),

        di::bind<ports::output::IWalletOperationRepository>()
            .to<adapters::secondary::InMemoryWalletOperationRepository>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application components
        // ====================================================================

        di::bind<application::ConfigRegistry>().to(configRegistry),
        di::bind<application::AccountLockRegistry>().in(di::singleton),
        di::bind<application::AssetRegistry>().in(di::singleton),
        di::bind<application::Ledger>().in(di::singleton),
        di::bind<application::PricingOracle>().in(di::singleton),
        di::bind<application::DailyLimitTracker>().in(di::singleton),
        di::bind<application::MoveHistoryStore>().in(di::singleton),
        di::bind<application::EventLog>().in(di::singleton),
        di::bind<application::opponent::WinRateController>().in(di::singleton),

        // ====================================================================
        // Layer 3: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IMatchService>()
            .to<application::MatchSettlementEngine>()
            .in(di::singleton),

        di::bind<ports::input::IWalletService>()
            .to<application::WalletService>()
            .in(di::singleton),

        di::bind<ports::input::IAdminService>()
            .to<application::AdminService>()
            .in(di::singleton));

    matchService_ = injector.create<std::shared_ptr<ports::input::IMatchService>>();
    walletService_ = injector.create<std::shared_ptr<ports::input::IWalletService>>();
    adminService_ = injector.create<std::shared_ptr<ports::input::IAdminService>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (9 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (3 bindings)" << std::endl;

    if (settings_->getAssets().empty()) {
        adminService_->registerAsset(DEFAULT_ASSET);
        auto oracle = injector.create<std::shared_ptr<ports::output::IPriceOracle>>();
        if (auto fixed = std::dynamic_pointer_cast<adapters::secondary::FixedPriceOracle>(oracle)) {
            fixed->setPrice(DEFAULT_ASSET.priceFeedId, DEFAULT_PRICE, DEFAULT_PRECISION);
        }
    } else {
        for (const auto& asset : settings_->getAssets()) {
            adminService_->registerAsset(asset);
        }
    }
}

void ArenaApp::runSimulation()
{
    const auto& sim = settings_->getSimulation();
    const auto assets = adminService_->listAssets();
    auto asset = std::find_if(assets.begin(), assets.end(), [](const auto& a) { return a.active; });
    if (asset == assets.end()) {
        std::cerr << "[ArenaApp] No active asset, simulation skipped" << std::endl;
        return;
    }

    std::cout << "\n🎲 Simulating " << sim.players << " players x "
              << sim.roundsPerPlayer << " rounds (stake " << sim.stake << ")" << std::endl;

    std::mt19937 rng(std::random_device{}());

    for (int p = 0; p < sim.players; ++p) {
        const std::string accountId = "player-" + std::to_string(p + 1);
        const auto style = static_cast<PlayerStyle>(p % 3);
        verification_->allow(accountId);

        try {
            domain::Credits budget = domain::checked::mul(sim.stake, sim.roundsPerPlayer);
            int64_t amount = walletService_->quotePurchase(asset->id, budget);
            amount = std::clamp(amount, asset->minPurchase, asset->maxPurchase);
            walletService_->purchase(accountId, asset->id, amount);
        } catch (const domain::ArenaException& e) {
            std::cerr << "[ArenaApp] Purchase failed for " << accountId << ": " << e.what() << std::endl;
            continue;
        }

        for (int round = 0; round < sim.roundsPerPlayer; ++round) {
            auto move = nextMove(style, round, rng);
            try {
                matchService_->playRound(accountId, domain::toString(move), sim.stake);
            } catch (const domain::ArenaException& e) {
                std::cerr << "[ArenaApp] " << accountId << " stopped: " << e.what() << std::endl;
                break;
            }
        }

        auto stats = matchService_->getWinRateStats(accountId);
        std::cout << "[ArenaApp] " << accountId << " (" << toString(style) << "): opponent won "
                  << stats.opponentWins << "/" << stats.rounds << " rounds, balance "
                  << walletService_->getBalance(accountId) << std::endl;

        domain::Credits balance = walletService_->getBalance(accountId);
        if (balance > 0) {
            try {
                walletService_->cashout(accountId, asset->id, balance);
            } catch (const domain::ArenaException& e) {
                std::cerr << "[ArenaApp] Cashout failed for " << accountId << ": " << e.what() << std::endl;
            }
        }
    }
}

void ArenaApp::printHouseReport()
{
    auto totals = adminService_->getHouseReport();
    std::cout << "\n📊 House report:" << std::endl;
    std::cout << "  purchased     " << std::setw(12) << totals.purchased << std::endl;
    std::cout << "  cashed out    " << std::setw(12) << totals.cashedOut << std::endl;
    std::cout << "  lost stakes   " << std::setw(12) << totals.lostStakes << std::endl;
    std::cout << "  win premiums  " << std::setw(12) << totals.winPremiums << std::endl;
    std::cout << "  house earnings" << std::setw(12) << totals.houseEarnings() << std::endl;
    std::cout << "  balances      " << std::setw(12) << totals.balances << std::endl;
    std::cout << "  reconciles    " << std::setw(12) << (totals.reconciles() ? "yes" : "NO") << std::endl;
}

void ArenaApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║        Stake Arena - Ledger & Match Engine           ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Randomness:   OpenSSL RAND_bytes                    ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
