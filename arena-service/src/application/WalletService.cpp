#include "application/WalletService.hpp"
#include "domain/ArenaError.hpp"
#include "domain/events/WalletEvents.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>

namespace arena::application {

using domain::ArenaException;
using domain::Credits;
using domain::ErrorCode;
using domain::Rounding;

WalletService::WalletService(
    std::shared_ptr<Ledger> ledger,
    std::shared_ptr<PricingOracle> pricing,
    std::shared_ptr<EventLog> eventLog,
    std::shared_ptr<ConfigRegistry> config,
    std::shared_ptr<AccountLockRegistry> locks,
    std::shared_ptr<ports::output::IVerificationProvider> verification,
    std::shared_ptr<ports::output::IWalletOperationRepository> operations,
    std::shared_ptr<ports::output::IClock> clock
) : ledger_(std::move(ledger))
  , pricing_(std::move(pricing))
  , eventLog_(std::move(eventLog))
  , config_(std::move(config))
  , locks_(std::move(locks))
  , verification_(std::move(verification))
  , operations_(std::move(operations))
  , clock_(std::move(clock))
{}

void WalletService::ensureNotPaused(const char* operation) const {
    if (config_->isPaused()) {
        throw ArenaException(ErrorCode::SystemPaused, std::string(operation) + " is paused");
    }
}

domain::WalletOperation WalletService::purchase(
    const std::string& accountId,
    const std::string& assetId,
    int64_t assetAmount
) {
    ensureNotPaused("purchase");
    if (assetAmount <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            "asset amount must be positive, got " + std::to_string(assetAmount));
    }
    if (!verification_->isVerified(accountId)) {
        throw ArenaException(ErrorCode::Unverified, accountId);
    }

    auto asset = pricing_->requireActiveAsset(assetId);
    PricingOracle::checkPurchaseBounds(asset, assetAmount);
    auto price = pricing_->getPrice(asset);

    Credits credits = PricingOracle::assetAmountToCredits(asset, price, assetAmount, Rounding::DOWN);
    if (credits <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            std::to_string(assetAmount) + " units of " + assetId + " are worth less than one credit");
    }

    auto lock = locks_->lock(accountId);

    domain::WalletOperation operation;
    operation.id = utils::IdGenerator::generateWithPrefix("wop");
    operation.accountId = accountId;
    operation.kind = domain::WalletOperationKind::PURCHASE;
    operation.assetId = assetId;
    operation.assetAmount = assetAmount;
    operation.credits = credits;
    operation.price = price;
    operation.timestamp = clock_->now();

    auto tx = ledger_->begin(accountId);
    tx.credit(credits, domain::LedgerReason::PURCHASE, operation.id);
    std::string payload = domain::CreditsPurchasedEvent(operation, tx.balance()).toJson();
    operations_->save(operation);
    tx.commit();

    eventLog_->append(accountId, domain::EventKind::PURCHASE, operation.id, payload, operation.timestamp);

    std::cout << "[WalletService] " << accountId << " purchased " << credits << " credits for "
              << assetAmount << " " << assetId << " units (balance=" << tx.balance() << ")" << std::endl;
    return operation;
}

domain::WalletOperation WalletService::cashout(
    const std::string& accountId,
    const std::string& assetId,
    Credits credits
) {
    ensureNotPaused("cashout");
    if (credits <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            "credits must be positive, got " + std::to_string(credits));
    }

    auto asset = pricing_->requireActiveAsset(assetId);
    auto price = pricing_->getPrice(asset);

    int64_t assetAmount = PricingOracle::creditsToAssetAmount(asset, price, credits, Rounding::DOWN);
    if (assetAmount <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            std::to_string(credits) + " credits are worth less than one unit of " + assetId);
    }
    PricingOracle::checkPurchaseBounds(asset, assetAmount);

    auto lock = locks_->lock(accountId);

    domain::WalletOperation operation;
    operation.id = utils::IdGenerator::generateWithPrefix("wop");
    operation.accountId = accountId;
    operation.kind = domain::WalletOperationKind::CASHOUT;
    operation.assetId = assetId;
    operation.assetAmount = assetAmount;
    operation.credits = credits;
    operation.price = price;
    operation.timestamp = clock_->now();

    auto tx = ledger_->begin(accountId);
    tx.debit(credits, domain::LedgerReason::CASHOUT, operation.id);
    std::string payload = domain::CreditsCashedOutEvent(operation, tx.balance()).toJson();
    operations_->save(operation);
    tx.commit();

    eventLog_->append(accountId, domain::EventKind::CASHOUT, operation.id, payload, operation.timestamp);

    std::cout << "[WalletService] " << accountId << " cashed out " << credits << " credits as "
              << assetAmount << " " << assetId << " units (balance=" << tx.balance() << ")" << std::endl;
    return operation;
}

int64_t WalletService::quotePurchase(const std::string& assetId, Credits credits) {
    if (credits <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            "credits must be positive, got " + std::to_string(credits));
    }
    return pricing_->creditsToAssetAmount(assetId, credits, Rounding::UP);
}

} // namespace arena::application
