#pragma once

#include "ports/output/IPriceOracle.hpp"
#include "ports/output/IClock.hpp"
#include "settings/ArenaSettings.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace arena::adapters::secondary {

/**
 * @brief Оракул с фиксированными ценами из настроек
 *
 * Каждая цена считается только что наблюдённой (observedAt = now).
 */
class FixedPriceOracle : public ports::output::IPriceOracle {
public:
    FixedPriceOracle(std::shared_ptr<settings::ArenaSettings> settings,
                     std::shared_ptr<ports::output::IClock> clock)
        : prices_(settings->getPrices())
        , clock_(std::move(clock))
    {}

    domain::PriceData getPrice(const std::string& priceFeedId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prices_.find(priceFeedId);
        if (it == prices_.end()) {
            throw std::runtime_error("Unknown price feed: " + priceFeedId);
        }
        return domain::PriceData(it->second.price, it->second.precision, clock_->now());
    }

    void setPrice(const std::string& priceFeedId, int64_t price, int precision) {
        std::lock_guard<std::mutex> lock(mutex_);
        prices_[priceFeedId] = settings::FeedPrice{price, precision};
    }

private:
    std::mutex mutex_;
    std::map<std::string, settings::FeedPrice> prices_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace arena::adapters::secondary
