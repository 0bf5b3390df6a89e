#pragma once

#include "ports/output/IClock.hpp"
#include "domain/Account.hpp"
#include "domain/LedgerEntry.hpp"
#include "ThreadSafeMap.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arena::application {

/**
 * @brief Единственный владелец балансов кредитов
 *
 * Все изменения баланса проходят через Transaction: списания и начисления
 * применяются к приватной копии баланса и публикуются одним шагом в commit().
 * Каждое опубликованное изменение оставляет LedgerEntry.
 *
 * Переполнение или попытка уйти в минус на уровне инварианта бросают
 * domain::InvariantViolation; ожидаемые отказы (InvalidInput,
 * InsufficientBalance) - domain::ArenaException.
 *
 * @note Вызывающий держит блокировку аккаунта (AccountLockRegistry) на время
 * транзакции. Ledger сам защищает только целостность своих структур.
 */
class Ledger {
    struct AccountSlot;

public:
    /**
     * @brief Staging-единица изменений одного аккаунта
     *
     * Уничтожение без commit() откатывает все изменения.
     *
     * @example
     * ```cpp
     * auto tx = ledger.begin("acc-1");
     * tx.debit(5, LedgerReason::STAKE, matchId);
     * tx.credit(6, LedgerReason::PAYOUT, matchId);
     * tx.commit();   // баланс и обе записи видны одновременно
     * ```
     */
    class Transaction {
    public:
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
        Transaction(Transaction&& other) noexcept;
        Transaction& operator=(Transaction&&) = delete;
        ~Transaction();

        void credit(domain::Credits amount, domain::LedgerReason reason, const std::string& reference);

        /**
         * @throws ArenaException(InsufficientBalance) если amount больше staged-баланса
         */
        void debit(domain::Credits amount, domain::LedgerReason reason, const std::string& reference);

        /**
         * @brief Staged-баланс с учётом всех операций транзакции
         */
        domain::Credits balance() const { return balance_; }

        const std::string& accountId() const { return accountId_; }

        bool committed() const { return committed_; }

        void commit();

    private:
        friend class Ledger;

        Transaction(Ledger* ledger, std::shared_ptr<AccountSlot> slot, std::string accountId,
                    domain::Credits startBalance, domain::Timestamp timestamp);

        void stage(domain::EntryDirection direction, domain::Credits amount,
                   domain::LedgerReason reason, const std::string& reference);

        Ledger* ledger_;
        std::shared_ptr<AccountSlot> slot_;
        std::string accountId_;
        domain::Credits startBalance_;
        domain::Credits balance_;
        domain::Timestamp timestamp_;
        std::vector<domain::LedgerEntry> staged_;
        bool committed_ = false;
    };

    explicit Ledger(std::shared_ptr<ports::output::IClock> clock);

    /**
     * @brief Начать транзакцию по аккаунту (аккаунт создаётся лениво)
     */
    Transaction begin(const std::string& accountId);

    /**
     * @brief Начислить кредиты отдельной транзакцией
     * @return Баланс после начисления
     */
    domain::Credits credit(const std::string& accountId, domain::Credits amount,
                           domain::LedgerReason reason, const std::string& reference);

    /**
     * @brief Списать кредиты отдельной транзакцией
     * @return Баланс после списания
     */
    domain::Credits debit(const std::string& accountId, domain::Credits amount,
                          domain::LedgerReason reason, const std::string& reference);

    domain::Credits getBalance(const std::string& accountId) const;

    std::optional<domain::Account> getAccount(const std::string& accountId) const;

    std::vector<domain::LedgerEntry> getEntries(const std::string& accountId) const;

    /**
     * @brief Агрегаты для сверки (корректны в точке покоя)
     */
    domain::LedgerTotals totals() const;

    bool reconciles() const {
        return totals().reconciles();
    }

private:
    struct AccountSlot {
        mutable std::mutex mutex;
        domain::Account account;
        std::vector<domain::LedgerEntry> entries;
    };

    void publish(Transaction& tx);

    std::shared_ptr<AccountSlot> slotFor(const std::string& accountId);

    std::shared_ptr<ports::output::IClock> clock_;
    ThreadSafeMap<std::string, AccountSlot> accounts_;
    std::atomic<uint64_t> nextEntryId_{1};

    mutable std::mutex totalsMutex_;
    domain::LedgerTotals flows_;    ///< Все агрегаты кроме balances
};

} // namespace arena::application
