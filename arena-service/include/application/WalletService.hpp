#pragma once

#include "ports/input/IWalletService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IVerificationProvider.hpp"
#include "ports/output/IWalletOperationRepository.hpp"
#include "application/AccountLockRegistry.hpp"
#include "application/ConfigRegistry.hpp"
#include "application/EventLog.hpp"
#include "application/Ledger.hpp"
#include "application/PricingOracle.hpp"
#include <memory>

namespace arena::application {

/**
 * @brief Покупка и вывод кредитов за внешние активы
 *
 * Цена запрашивается до взятия блокировки аккаунта, так что медленный
 * оракул не держит аккаунт. Изменение баланса, запись операции и событие
 * выполняются под блокировкой одной Ledger-транзакцией.
 */
class WalletService : public ports::input::IWalletService {
public:
    WalletService(
        std::shared_ptr<Ledger> ledger,
        std::shared_ptr<PricingOracle> pricing,
        std::shared_ptr<EventLog> eventLog,
        std::shared_ptr<ConfigRegistry> config,
        std::shared_ptr<AccountLockRegistry> locks,
        std::shared_ptr<ports::output::IVerificationProvider> verification,
        std::shared_ptr<ports::output::IWalletOperationRepository> operations,
        std::shared_ptr<ports::output::IClock> clock
    );

    domain::WalletOperation purchase(
        const std::string& accountId,
        const std::string& assetId,
        int64_t assetAmount
    ) override;

    domain::WalletOperation cashout(
        const std::string& accountId,
        const std::string& assetId,
        domain::Credits credits
    ) override;

    int64_t quotePurchase(const std::string& assetId, domain::Credits credits) override;

    domain::Credits getBalance(const std::string& accountId) override {
        return ledger_->getBalance(accountId);
    }

    std::vector<domain::LedgerEntry> getLedgerEntries(const std::string& accountId) override {
        return ledger_->getEntries(accountId);
    }

    std::vector<domain::WalletOperation> getWalletOperations(const std::string& accountId) override {
        return operations_->findByAccountId(accountId);
    }

private:
    std::shared_ptr<Ledger> ledger_;
    std::shared_ptr<PricingOracle> pricing_;
    std::shared_ptr<EventLog> eventLog_;
    std::shared_ptr<ConfigRegistry> config_;
    std::shared_ptr<AccountLockRegistry> locks_;
    std::shared_ptr<ports::output::IVerificationProvider> verification_;
    std::shared_ptr<ports::output::IWalletOperationRepository> operations_;
    std::shared_ptr<ports::output::IClock> clock_;

    void ensureNotPaused(const char* operation) const;
};

} // namespace arena::application
