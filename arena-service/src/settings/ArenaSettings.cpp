#include "settings/ArenaSettings.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace arena::settings {

ArenaSettings::ArenaSettings() {
    const char* path = std::getenv("ARENA_CONFIG_FILE");
    if (path && *path) {
        std::ifstream file(path);
        if (!file) {
            throw std::invalid_argument(std::string("Cannot open ARENA_CONFIG_FILE: ") + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        applyJson(buffer.str());
    }
    applyEnvironment();
    validate();
}

ArenaSettings ArenaSettings::fromJson(const std::string& jsonText) {
    ArenaSettings settings{DefaultsTag{}};
    settings.applyJson(jsonText);
    settings.validate();
    return settings;
}

void ArenaSettings::applyJson(const std::string& jsonText) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("Invalid arena config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Arena config JSON must be an object");
    }

    try {
        config_.maxDailyRounds = j.value("max_daily_rounds", config_.maxDailyRounds);
        config_.maxDailyWager = j.value("max_daily_wager", config_.maxDailyWager);
        config_.winMultiplierBps = j.value("win_multiplier_bps", config_.winMultiplierBps);
        config_.targetWinRate = j.value("target_win_rate", config_.targetWinRate);
        config_.historyWindow = j.value("history_window", config_.historyWindow);
        config_.winRateWindow = j.value("win_rate_window", config_.winRateWindow);
        if (j.contains("win_rate_scope")) {
            config_.winRateScope = domain::winRateScopeFromString(j["win_rate_scope"].get<std::string>());
        }
        if (j.contains("max_price_age_seconds")) {
            config_.maxPriceAge = std::chrono::seconds(j["max_price_age_seconds"].get<int64_t>());
        }
        if (j.contains("oracle_timeout_ms")) {
            config_.oracleTimeout = std::chrono::milliseconds(j["oracle_timeout_ms"].get<int64_t>());
        }
        if (j.contains("default_difficulty")) {
            config_.defaultDifficulty = domain::difficultyFromString(j["default_difficulty"].get<std::string>());
        }

        if (j.contains("assets")) {
            for (const auto& item : j["assets"]) {
                assets_.emplace_back(
                    item.at("id").get<std::string>(),
                    item.at("price_feed_id").get<std::string>(),
                    item.at("decimals").get<int>(),
                    item.at("min_purchase").get<int64_t>(),
                    item.at("max_purchase").get<int64_t>(),
                    item.value("active", true)
                );
            }
        }

        if (j.contains("prices")) {
            for (const auto& [feedId, item] : j["prices"].items()) {
                prices_[feedId] = FeedPrice{item.at("price").get<int64_t>(), item.value("precision", 0)};
            }
        }

        if (j.contains("simulation")) {
            const auto& sim = j["simulation"];
            simulation_.players = sim.value("players", simulation_.players);
            simulation_.roundsPerPlayer = sim.value("rounds", simulation_.roundsPerPlayer);
            simulation_.stake = sim.value("stake", simulation_.stake);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid arena config value: ") + e.what());
    }
}

void ArenaSettings::applyEnvironment() {
    config_.maxDailyRounds = std::stoll(getEnvOrDefault("ARENA_MAX_DAILY_ROUNDS",
        std::to_string(config_.maxDailyRounds)));
    config_.maxDailyWager = std::stoll(getEnvOrDefault("ARENA_MAX_DAILY_WAGER",
        std::to_string(config_.maxDailyWager)));
    config_.winMultiplierBps = std::stoll(getEnvOrDefault("ARENA_WIN_MULTIPLIER_BPS",
        std::to_string(config_.winMultiplierBps)));
    config_.targetWinRate = std::stod(getEnvOrDefault("ARENA_TARGET_WIN_RATE",
        std::to_string(config_.targetWinRate)));
    config_.historyWindow = std::stoul(getEnvOrDefault("ARENA_HISTORY_WINDOW",
        std::to_string(config_.historyWindow)));
    config_.winRateScope = domain::winRateScopeFromString(getEnvOrDefault("ARENA_WIN_RATE_SCOPE",
        domain::toString(config_.winRateScope)));
    config_.winRateWindow = std::stoul(getEnvOrDefault("ARENA_WIN_RATE_WINDOW",
        std::to_string(config_.winRateWindow)));
    config_.maxPriceAge = std::chrono::seconds(std::stoll(getEnvOrDefault("ARENA_MAX_PRICE_AGE_SECONDS",
        std::to_string(config_.maxPriceAge.count()))));
    config_.oracleTimeout = std::chrono::milliseconds(std::stoll(getEnvOrDefault("ARENA_ORACLE_TIMEOUT_MS",
        std::to_string(config_.oracleTimeout.count()))));
    config_.defaultDifficulty = domain::difficultyFromString(getEnvOrDefault("ARENA_DEFAULT_DIFFICULTY",
        domain::toString(config_.defaultDifficulty)));

    simulation_.players = std::stoi(getEnvOrDefault("ARENA_SIM_PLAYERS", std::to_string(simulation_.players)));
    simulation_.roundsPerPlayer = std::stoi(getEnvOrDefault("ARENA_SIM_ROUNDS",
        std::to_string(simulation_.roundsPerPlayer)));
    simulation_.stake = std::stoll(getEnvOrDefault("ARENA_SIM_STAKE", std::to_string(simulation_.stake)));
}

void ArenaSettings::validate() const {
    if (config_.maxDailyRounds <= 0) {
        throw std::invalid_argument("max_daily_rounds must be positive");
    }
    if (config_.maxDailyWager <= 0) {
        throw std::invalid_argument("max_daily_wager must be positive");
    }
    if (config_.winMultiplierBps < 10'000 || config_.winMultiplierBps > 1'000'000) {
        throw std::invalid_argument("win_multiplier_bps must be in [10000, 1000000]");
    }
    if (config_.targetWinRate <= 1.0 / 3.0 || config_.targetWinRate >= 1.0) {
        throw std::invalid_argument("target_win_rate must be in (1/3, 1)");
    }
    if (config_.historyWindow == 0 || config_.historyWindow > 1000) {
        throw std::invalid_argument("history_window must be in [1, 1000]");
    }
    if (config_.winRateWindow == 0) {
        throw std::invalid_argument("win_rate_window must be positive");
    }
    if (config_.maxPriceAge.count() < 0 || config_.oracleTimeout.count() <= 0) {
        throw std::invalid_argument("max_price_age_seconds must be >= 0 and oracle_timeout_ms > 0");
    }
}

std::string ArenaSettings::getEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

} // namespace arena::settings
