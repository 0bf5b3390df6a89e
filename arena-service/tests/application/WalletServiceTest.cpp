/**
 * @file WalletServiceTest.cpp
 * @brief Unit tests for WalletService purchase/cashout
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>
#include "application/WalletService.hpp"
#include "domain/ArenaError.hpp"
#include "../mocks/FailingRepositories.hpp"
#include "../mocks/FakeClock.hpp"
#include "../mocks/MockPriceOracle.hpp"
#include "../mocks/MockVerificationProvider.hpp"
#include "../mocks/RecordingEventPublisher.hpp"
#include <functional>

using namespace arena;
using namespace arena::application;
using namespace arena::tests;
using domain::ArenaException;
using domain::ErrorCode;
using domain::PriceData;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace {

// 1 USDC = 1.00 кредита; 1 кредит = 1'000'000 минимальных единиц
const domain::SupportedAsset USDC{"USDC", "feed-usdc", 6, 1'000'000, 10'000'000'000};

} // namespace

class WalletServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        oracle_ = std::make_shared<NiceMock<MockPriceOracle>>();
        verification_ = std::make_shared<NiceMock<MockVerificationProvider>>();
        publisher_ = std::make_shared<RecordingEventPublisher>();
        config_ = std::make_shared<ConfigRegistry>();
        assets_ = std::make_shared<AssetRegistry>();
        ledger_ = std::make_shared<Ledger>(clock_);
        eventLog_ = std::make_shared<EventLog>(publisher_);
        operations_ = std::make_shared<FailingWalletOperationRepository>();

        assets_->registerAsset(USDC);
        ON_CALL(*oracle_, getPrice("feed-usdc")).WillByDefault(Return(PriceData(100, 2, clock_->now())));
        ON_CALL(*verification_, isVerified(_)).WillByDefault(Return(true));

        auto pricing = std::make_shared<PricingOracle>(oracle_, assets_, config_, clock_);
        wallet_ = std::make_shared<WalletService>(
            ledger_, pricing, eventLog_, config_, std::make_shared<AccountLockRegistry>(),
            verification_, operations_, clock_);
    }

    ErrorCode errorOf(const std::function<void()>& action) {
        try {
            action();
        } catch (const ArenaException& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected ArenaException";
        return ErrorCode::InvalidInput;
    }

    void expectNoStateChange(const std::string& account, domain::Credits balance) {
        EXPECT_EQ(wallet_->getBalance(account), balance);
        EXPECT_TRUE(ledger_->reconciles());
        EXPECT_EQ(wallet_->getWalletOperations(account).size(), operationsBefore_);
        EXPECT_EQ(eventLog_->size(), eventsBefore_);
    }

    void snapshot(const std::string& account) {
        operationsBefore_ = wallet_->getWalletOperations(account).size();
        eventsBefore_ = eventLog_->size();
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<NiceMock<MockPriceOracle>> oracle_;
    std::shared_ptr<NiceMock<MockVerificationProvider>> verification_;
    std::shared_ptr<RecordingEventPublisher> publisher_;
    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<AssetRegistry> assets_;
    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<EventLog> eventLog_;
    std::shared_ptr<FailingWalletOperationRepository> operations_;
    std::shared_ptr<WalletService> wallet_;
    std::size_t operationsBefore_ = 0;
    std::size_t eventsBefore_ = 0;
};

// ============================================
// Purchase
// ============================================

TEST_F(WalletServiceTest, Purchase_CreditsAtOraclePrice) {
    auto op = wallet_->purchase("acc-1", "USDC", 5'000'000);

    EXPECT_EQ(op.kind, domain::WalletOperationKind::PURCHASE);
    EXPECT_EQ(op.credits, 5);
    EXPECT_EQ(op.price.price, 100);
    EXPECT_EQ(op.id.rfind("wop-", 0), 0u);
    EXPECT_EQ(wallet_->getBalance("acc-1"), 5);

    auto entries = wallet_->getLedgerEntries("acc-1");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].reason, domain::LedgerReason::PURCHASE);
    EXPECT_EQ(entries[0].reference, op.id);
}

TEST_F(WalletServiceTest, Purchase_FractionalCreditsRoundDown) {
    auto op = wallet_->purchase("acc-1", "USDC", 2'999'999);
    EXPECT_EQ(op.credits, 2);
}

TEST_F(WalletServiceTest, Purchase_RecordsOperationAndEvent) {
    auto op = wallet_->purchase("acc-1", "USDC", 3'000'000);

    auto stored = wallet_->getWalletOperations("acc-1");
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].id, op.id);

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].routingKey, "arena.purchase");
    auto json = nlohmann::json::parse(messages[0].message);
    EXPECT_EQ(json["payload"]["eventType"], "credits.purchased");
    EXPECT_EQ(json["payload"]["credits"], 3);
    EXPECT_EQ(json["payload"]["balanceAfter"], 3);
}

TEST_F(WalletServiceTest, Purchase_Unverified) {
    EXPECT_CALL(*verification_, isVerified("acc-1")).WillOnce(Return(false));
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 5'000'000); }), ErrorCode::Unverified);
    expectNoStateChange("acc-1", 0);
}

TEST_F(WalletServiceTest, Purchase_OutOfBounds) {
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 999'999); }), ErrorCode::PurchaseOutOfBounds);
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 10'000'000'001); }), ErrorCode::PurchaseOutOfBounds);
    EXPECT_NO_THROW(wallet_->purchase("acc-1", "USDC", 1'000'000));
}

TEST_F(WalletServiceTest, Purchase_NonPositiveAmount) {
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 0); }), ErrorCode::InvalidInput);
}

TEST_F(WalletServiceTest, Purchase_UnknownOrInactiveAsset) {
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "DOGE", 5'000'000); }), ErrorCode::AssetNotSupported);

    assets_->deactivate("USDC");
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 5'000'000); }), ErrorCode::AssetInactive);
}

TEST_F(WalletServiceTest, Purchase_OracleFailure_NoStateChange) {
    wallet_->purchase("acc-1", "USDC", 5'000'000);
    snapshot("acc-1");

    EXPECT_CALL(*oracle_, getPrice("feed-usdc")).WillOnce(Throw(std::runtime_error("feed offline")));
    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 5'000'000); }), ErrorCode::OracleUnavailable);
    expectNoStateChange("acc-1", 5);
}

TEST_F(WalletServiceTest, Purchase_StalePrice_NoStateChange) {
    snapshot("acc-1");
    EXPECT_CALL(*oracle_, getPrice("feed-usdc"))
        .WillOnce(Return(PriceData(100, 2, clock_->now().addSeconds(-301))));

    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 5'000'000); }), ErrorCode::StalePrice);
    expectNoStateChange("acc-1", 0);
}

TEST_F(WalletServiceTest, Purchase_OperationSaveFailure_NoStateChange) {
    snapshot("acc-1");
    operations_->setFailing(true);

    EXPECT_THROW(wallet_->purchase("acc-1", "USDC", 5'000'000), std::runtime_error);
    expectNoStateChange("acc-1", 0);
    EXPECT_TRUE(wallet_->getLedgerEntries("acc-1").empty());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(WalletServiceTest, Paused_BlocksPurchaseAndCashout) {
    wallet_->purchase("acc-1", "USDC", 5'000'000);
    config_->setPaused(true);

    EXPECT_EQ(errorOf([&] { wallet_->purchase("acc-1", "USDC", 5'000'000); }), ErrorCode::SystemPaused);
    EXPECT_EQ(errorOf([&] { wallet_->cashout("acc-1", "USDC", 1); }), ErrorCode::SystemPaused);
    EXPECT_EQ(wallet_->getBalance("acc-1"), 5);
}

// ============================================
// Cashout
// ============================================

TEST_F(WalletServiceTest, Cashout_DebitsAndPaysAsset) {
    wallet_->purchase("acc-1", "USDC", 5'000'000);

    auto op = wallet_->cashout("acc-1", "USDC", 2);

    EXPECT_EQ(op.kind, domain::WalletOperationKind::CASHOUT);
    EXPECT_EQ(op.assetAmount, 2'000'000);
    EXPECT_EQ(wallet_->getBalance("acc-1"), 3);

    auto totals = ledger_->totals();
    EXPECT_EQ(totals.purchased, 5);
    EXPECT_EQ(totals.cashedOut, 2);
    EXPECT_TRUE(totals.reconciles());

    auto events = eventLog_->entriesFor("acc-1");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].kind, domain::EventKind::CASHOUT);
    EXPECT_EQ(events[1].sequenceNumber, 2u);
}

TEST_F(WalletServiceTest, Cashout_AboveBalance_InsufficientBalance) {
    wallet_->purchase("acc-1", "USDC", 5'000'000);
    snapshot("acc-1");

    EXPECT_EQ(errorOf([&] { wallet_->cashout("acc-1", "USDC", 6); }), ErrorCode::InsufficientBalance);
    expectNoStateChange("acc-1", 5);
}

TEST_F(WalletServiceTest, Cashout_OperationSaveFailure_NoStateChange) {
    wallet_->purchase("acc-1", "USDC", 5'000'000);
    snapshot("acc-1");
    operations_->setFailing(true);

    EXPECT_THROW(wallet_->cashout("acc-1", "USDC", 2), std::runtime_error);
    expectNoStateChange("acc-1", 5);
    EXPECT_EQ(ledger_->totals().cashedOut, 0);

    operations_->setFailing(false);
    wallet_->cashout("acc-1", "USDC", 2);
    EXPECT_EQ(wallet_->getBalance("acc-1"), 3);
}

TEST_F(WalletServiceTest, Cashout_NonPositiveCredits) {
    EXPECT_EQ(errorOf([&] { wallet_->cashout("acc-1", "USDC", 0); }), ErrorCode::InvalidInput);
}

// ============================================
// Quote
// ============================================

TEST_F(WalletServiceTest, Quote_RoundsUpAndCoversCredits) {
    EXPECT_EQ(wallet_->quotePurchase("USDC", 10), 10'000'000);

    // Цена 3.00: за 1 кредит нужно ceil(1/3 USDC)
    EXPECT_CALL(*oracle_, getPrice("feed-usdc")).WillRepeatedly(Return(PriceData(300, 2, clock_->now())));
    auto amount = wallet_->quotePurchase("USDC", 1);
    EXPECT_EQ(amount, 333'334);
}

TEST_F(WalletServiceTest, Quote_NonPositiveCredits) {
    EXPECT_EQ(errorOf([&] { wallet_->quotePurchase("USDC", 0); }), ErrorCode::InvalidInput);
}
