#pragma once

#include "domain/SupportedAsset.hpp"
#include "domain/ArenaError.hpp"
#include "ThreadSafeMap.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arena::application {

/**
 * @brief Реестр активов, принимаемых к оплате
 *
 * Меняется только администратором. Запись заменяется целиком,
 * поэтому читатели всегда видят согласованный снимок актива.
 */
class AssetRegistry {
public:
    /**
     * @brief Зарегистрировать или обновить актив
     * @throws ArenaException(InvalidInput) при некорректных параметрах
     */
    void registerAsset(const domain::SupportedAsset& asset) {
        validate(asset);
        assets_.insert(asset.id, std::make_shared<domain::SupportedAsset>(asset));
        std::cout << "[AssetRegistry] Registered " << asset.id
                  << " (feed=" << asset.priceFeedId << ", decimals=" << asset.decimals << ")" << std::endl;
    }

    void deactivate(const std::string& assetId) {
        setActive(assetId, false);
    }

    void activate(const std::string& assetId) {
        setActive(assetId, true);
    }

    std::optional<domain::SupportedAsset> find(const std::string& assetId) const {
        auto asset = assets_.find(assetId);
        if (!asset) {
            return std::nullopt;
        }
        return *asset;
    }

    /**
     * @brief Все активы, отсортированные по id
     */
    std::vector<domain::SupportedAsset> list() const {
        std::vector<domain::SupportedAsset> result;
        for (const auto& asset : assets_.getAll()) {
            result.push_back(*asset);
        }
        std::sort(result.begin(), result.end(),
                  [](const auto& a, const auto& b) { return a.id < b.id; });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::SupportedAsset> assets_;

    void setActive(const std::string& assetId, bool active) {
        auto current = assets_.find(assetId);
        if (!current) {
            throw domain::ArenaException(domain::ErrorCode::AssetNotSupported, assetId);
        }
        auto updated = std::make_shared<domain::SupportedAsset>(*current);
        updated->active = active;
        assets_.insert(assetId, updated);
        std::cout << "[AssetRegistry] " << assetId << (active ? " activated" : " deactivated") << std::endl;
    }

    static void validate(const domain::SupportedAsset& asset) {
        using domain::ArenaException;
        using domain::ErrorCode;
        if (asset.id.empty()) {
            throw ArenaException(ErrorCode::InvalidInput, "asset id is empty");
        }
        if (asset.priceFeedId.empty()) {
            throw ArenaException(ErrorCode::InvalidInput, "price feed id is empty for " + asset.id);
        }
        if (asset.decimals < 0 || asset.decimals > 18) {
            throw ArenaException(ErrorCode::InvalidInput,
                "decimals must be in [0, 18] for " + asset.id);
        }
        if (asset.minPurchase <= 0 || asset.maxPurchase < asset.minPurchase) {
            throw ArenaException(ErrorCode::InvalidInput,
                "purchase bounds must satisfy 0 < min <= max for " + asset.id);
        }
    }
};

} // namespace arena::application
