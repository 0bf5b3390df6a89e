#pragma once

#include "domain/ArenaConfig.hpp"
#include "domain/SupportedAsset.hpp"
#include <map>
#include <string>
#include <vector>

namespace arena::settings {

/**
 * @brief Цена фида для FixedPriceOracle
 */
struct FeedPrice {
    int64_t price = 0;
    int precision = 0;
};

/**
 * @brief Параметры прогона arena-sim
 */
struct SimulationSettings {
    int players = 3;
    int roundsPerPlayer = 10;
    domain::Credits stake = 10;
};

/**
 * @brief Настройки платформы
 *
 * Порядок применения: значения по умолчанию, затем JSON-файл из
 * ARENA_CONFIG_FILE (если задан), затем переменные окружения.
 *
 * Переменные окружения:
 * - ARENA_MAX_DAILY_ROUNDS: раундов в сутки (10)
 * - ARENA_MAX_DAILY_WAGER: сумма ставок в сутки (10000)
 * - ARENA_WIN_MULTIPLIER_BPS: выплата за победу, bps (12500 = 125%)
 * - ARENA_TARGET_WIN_RATE: целевая доля побед соперника (0.75)
 * - ARENA_HISTORY_WINDOW: окно истории ходов (10)
 * - ARENA_WIN_RATE_SCOPE: PER_ACCOUNT или PLATFORM
 * - ARENA_WIN_RATE_WINDOW: скользящее окно статистики (50)
 * - ARENA_MAX_PRICE_AGE_SECONDS: максимальный возраст цены (300)
 * - ARENA_ORACLE_TIMEOUT_MS: таймаут оракула (2000)
 * - ARENA_DEFAULT_DIFFICULTY: EASY, MEDIUM, HARD
 * - ARENA_SIM_PLAYERS, ARENA_SIM_ROUNDS, ARENA_SIM_STAKE: параметры симуляции
 *
 * @example ARENA_CONFIG_FILE:
 * ```json
 * {
 *   "max_daily_rounds": 20,
 *   "target_win_rate": 0.75,
 *   "assets": [
 *     {"id": "USDC", "price_feed_id": "feed-usdc", "decimals": 6,
 *      "min_purchase": 1000000, "max_purchase": 10000000000}
 *   ],
 *   "prices": {"feed-usdc": {"price": 100, "precision": 2}}
 * }
 * ```
 */
class ArenaSettings {
public:
    /**
     * @brief Читает настройки из файла и ENV
     * @throws std::invalid_argument при некорректном значении
     */
    ArenaSettings();

    /**
     * @brief Настройки из JSON-текста без учёта ENV
     */
    static ArenaSettings fromJson(const std::string& jsonText);

    const domain::ArenaConfig& getConfig() const { return config_; }
    const std::vector<domain::SupportedAsset>& getAssets() const { return assets_; }
    const std::map<std::string, FeedPrice>& getPrices() const { return prices_; }
    const SimulationSettings& getSimulation() const { return simulation_; }

private:
    struct DefaultsTag {};
    explicit ArenaSettings(DefaultsTag) {}

    domain::ArenaConfig config_;
    std::vector<domain::SupportedAsset> assets_;
    std::map<std::string, FeedPrice> prices_;
    SimulationSettings simulation_;

    void applyJson(const std::string& jsonText);
    void applyEnvironment();
    void validate() const;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue);
};

} // namespace arena::settings
