#include "application/PricingOracle.hpp"
#include "domain/ArenaError.hpp"

namespace arena::application {

using domain::ArenaException;
using domain::Credits;
using domain::ErrorCode;
using domain::PriceData;
using domain::Rounding;
using domain::SupportedAsset;

PricingOracle::PricingOracle(
    std::shared_ptr<ports::output::IPriceOracle> oracle,
    std::shared_ptr<AssetRegistry> assets,
    std::shared_ptr<ConfigRegistry> config,
    std::shared_ptr<ports::output::IClock> clock
) : assets_(std::move(assets))
  , config_(std::move(config))
  , clock_(std::move(clock))
  , fetcher_(std::make_unique<PriceFetchWorker>(std::move(oracle)))
{}

SupportedAsset PricingOracle::requireActiveAsset(const std::string& assetId) const {
    auto asset = assets_->find(assetId);
    if (!asset) {
        throw ArenaException(ErrorCode::AssetNotSupported, assetId);
    }
    if (!asset->active) {
        throw ArenaException(ErrorCode::AssetInactive, assetId);
    }
    return *asset;
}

PriceData PricingOracle::getPrice(const std::string& assetId) {
    return getPrice(requireActiveAsset(assetId));
}

PriceData PricingOracle::getPrice(const SupportedAsset& asset) {
    auto cfg = config_->get();
    PriceData price = fetcher_->fetch(asset.priceFeedId, cfg.oracleTimeout);

    if (price.price <= 0) {
        throw ArenaException(ErrorCode::OracleUnavailable,
            "non-positive price for " + asset.id + ": " + std::to_string(price.price));
    }
    if (price.precision < 0 || asset.decimals + price.precision > 18) {
        throw ArenaException(ErrorCode::OracleUnavailable,
            "unsupported price precision " + std::to_string(price.precision) + " for " + asset.id);
    }

    auto age = clock_->now().toUnixMillis() - price.observedAt.toUnixMillis();
    auto maxAge = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.maxPriceAge).count();
    if (age > maxAge) {
        throw ArenaException(ErrorCode::StalePrice,
            asset.id + " price is " + std::to_string(age) + "ms old (max " + std::to_string(maxAge) + "ms)");
    }
    return price;
}

int64_t PricingOracle::creditsToAssetAmount(const std::string& assetId, Credits credits, Rounding rounding) {
    auto asset = requireActiveAsset(assetId);
    return creditsToAssetAmount(asset, getPrice(asset), credits, rounding);
}

Credits PricingOracle::assetAmountToCredits(const std::string& assetId, int64_t assetAmount, Rounding rounding) {
    auto asset = requireActiveAsset(assetId);
    return assetAmountToCredits(asset, getPrice(asset), assetAmount, rounding);
}

int64_t PricingOracle::scaleOf(const SupportedAsset& asset, const PriceData& price) {
    return domain::checked::pow10(asset.decimals + price.precision);
}

int64_t PricingOracle::creditsToAssetAmount(const SupportedAsset& asset, const PriceData& price,
                                            Credits credits, Rounding rounding) {
    if (credits < 0) {
        throw ArenaException(ErrorCode::InvalidInput, "credits must be non-negative");
    }
    return domain::checked::mulDiv(credits, scaleOf(asset, price), price.price, rounding);
}

Credits PricingOracle::assetAmountToCredits(const SupportedAsset& asset, const PriceData& price,
                                            int64_t assetAmount, Rounding rounding) {
    if (assetAmount < 0) {
        throw ArenaException(ErrorCode::InvalidInput, "asset amount must be non-negative");
    }
    return domain::checked::mulDiv(assetAmount, price.price, scaleOf(asset, price), rounding);
}

Credits PricingOracle::roundTripTolerance(const SupportedAsset& asset, const PriceData& price) {
    Credits unitValue = domain::checked::mulDiv(1, price.price, scaleOf(asset, price), Rounding::UP);
    return unitValue < 1 ? 1 : unitValue;
}

void PricingOracle::checkPurchaseBounds(const SupportedAsset& asset, int64_t assetAmount) {
    if (assetAmount < asset.minPurchase || assetAmount > asset.maxPurchase) {
        throw ArenaException(ErrorCode::PurchaseOutOfBounds,
            std::to_string(assetAmount) + " not in [" + std::to_string(asset.minPurchase)
            + ", " + std::to_string(asset.maxPurchase) + "] for " + asset.id);
    }
}

} // namespace arena::application
