#include "application/Ledger.hpp"
#include "domain/ArenaError.hpp"
#include <iostream>
#include <map>

namespace arena::application {

using domain::ArenaException;
using domain::Credits;
using domain::EntryDirection;
using domain::ErrorCode;
using domain::InvariantViolation;
using domain::LedgerReason;

// ============================================================================
// Transaction
// ============================================================================

Ledger::Transaction::Transaction(Ledger* ledger, std::shared_ptr<AccountSlot> slot,
                                 std::string accountId, Credits startBalance,
                                 domain::Timestamp timestamp)
    : ledger_(ledger)
    , slot_(std::move(slot))
    , accountId_(std::move(accountId))
    , startBalance_(startBalance)
    , balance_(startBalance)
    , timestamp_(timestamp)
{}

Ledger::Transaction::Transaction(Transaction&& other) noexcept
    : ledger_(other.ledger_)
    , slot_(std::move(other.slot_))
    , accountId_(std::move(other.accountId_))
    , startBalance_(other.startBalance_)
    , balance_(other.balance_)
    , timestamp_(other.timestamp_)
    , staged_(std::move(other.staged_))
    , committed_(other.committed_)
{
    other.staged_.clear();
    other.committed_ = true;
}

Ledger::Transaction::~Transaction() {
    if (!committed_ && !staged_.empty()) {
        std::cout << "[Ledger] Rolled back " << staged_.size()
                  << " staged entries for " << accountId_ << std::endl;
    }
}

void Ledger::Transaction::credit(Credits amount, LedgerReason reason, const std::string& reference) {
    stage(EntryDirection::CREDIT, amount, reason, reference);
}

void Ledger::Transaction::debit(Credits amount, LedgerReason reason, const std::string& reference) {
    stage(EntryDirection::DEBIT, amount, reason, reference);
}

void Ledger::Transaction::stage(EntryDirection direction, Credits amount,
                                LedgerReason reason, const std::string& reference) {
    if (committed_) {
        throw InvariantViolation("ledger transaction for " + accountId_ + " already committed");
    }
    if (amount <= 0) {
        throw ArenaException(ErrorCode::InvalidInput,
            "ledger amount must be positive, got " + std::to_string(amount));
    }

    Credits next = 0;
    if (direction == EntryDirection::DEBIT) {
        if (amount > balance_) {
            throw ArenaException(ErrorCode::InsufficientBalance,
                "balance " + std::to_string(balance_) + " < " + std::to_string(amount));
        }
        next = domain::checked::sub(balance_, amount);
    } else {
        next = domain::checked::add(balance_, amount);
    }

    domain::LedgerEntry entry;
    entry.accountId = accountId_;
    entry.direction = direction;
    entry.reason = reason;
    entry.reference = reference;
    entry.amount = amount;
    entry.balanceAfter = next;
    entry.timestamp = timestamp_;

    staged_.push_back(std::move(entry));
    balance_ = next;
}

void Ledger::Transaction::commit() {
    if (committed_) {
        throw InvariantViolation("ledger transaction for " + accountId_ + " committed twice");
    }
    ledger_->publish(*this);
    committed_ = true;
}

// ============================================================================
// Ledger
// ============================================================================

Ledger::Ledger(std::shared_ptr<ports::output::IClock> clock)
    : clock_(std::move(clock))
{}

std::shared_ptr<Ledger::AccountSlot> Ledger::slotFor(const std::string& accountId) {
    auto now = clock_->now();
    return accounts_.getOrCreate(accountId, [&] {
        auto slot = std::make_shared<AccountSlot>();
        slot->account = domain::Account(accountId, now);
        return slot;
    });
}

Ledger::Transaction Ledger::begin(const std::string& accountId) {
    if (accountId.empty()) {
        throw ArenaException(ErrorCode::InvalidInput, "accountId is empty");
    }
    auto slot = slotFor(accountId);
    Credits balance = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        balance = slot->account.creditBalance;
    }
    return Transaction(this, slot, accountId, balance, clock_->now());
}

void Ledger::publish(Transaction& tx) {
    if (tx.staged_.empty()) {
        return;
    }
    if (tx.balance_ < 0) {
        throw InvariantViolation("negative balance for " + tx.accountId_);
    }

    // Классификация потоков для сверки: ставка и выплата одного матча
    // сводятся в проигранную ставку или премию выигрыша.
    std::map<std::string, std::pair<Credits, Credits>> rounds;  // reference -> (stake, payout)
    domain::LedgerTotals delta;
    for (const auto& entry : tx.staged_) {
        switch (entry.reason) {
            case LedgerReason::PURCHASE:
                delta.purchased = domain::checked::add(delta.purchased, entry.amount);
                break;
            case LedgerReason::CASHOUT:
                delta.cashedOut = domain::checked::add(delta.cashedOut, entry.amount);
                break;
            case LedgerReason::STAKE:
                rounds[entry.reference].first = domain::checked::add(rounds[entry.reference].first, entry.amount);
                break;
            case LedgerReason::PAYOUT:
                rounds[entry.reference].second = domain::checked::add(rounds[entry.reference].second, entry.amount);
                break;
        }
    }
    for (const auto& [reference, flow] : rounds) {
        const auto& [stake, payout] = flow;
        if (payout < stake) {
            delta.lostStakes = domain::checked::add(delta.lostStakes, stake - payout);
        } else {
            delta.winPremiums = domain::checked::add(delta.winPremiums, payout - stake);
        }
    }

    std::scoped_lock lock(tx.slot_->mutex, totalsMutex_);

    auto& account = tx.slot_->account;
    if (account.creditBalance != tx.startBalance_) {
        throw InvariantViolation("concurrent ledger mutation for " + tx.accountId_
            + ": expected " + std::to_string(tx.startBalance_)
            + ", found " + std::to_string(account.creditBalance));
    }

    domain::LedgerTotals next = flows_;
    next.purchased = domain::checked::add(next.purchased, delta.purchased);
    next.cashedOut = domain::checked::add(next.cashedOut, delta.cashedOut);
    next.lostStakes = domain::checked::add(next.lostStakes, delta.lostStakes);
    next.winPremiums = domain::checked::add(next.winPremiums, delta.winPremiums);

    for (auto& entry : tx.staged_) {
        entry.id = nextEntryId_.fetch_add(1);
        tx.slot_->entries.push_back(entry);
    }
    account.creditBalance = tx.balance_;
    account.lastKnownDay = tx.timestamp_.utcDayKey();
    flows_ = next;
}

Credits Ledger::credit(const std::string& accountId, Credits amount,
                       LedgerReason reason, const std::string& reference) {
    auto tx = begin(accountId);
    tx.credit(amount, reason, reference);
    tx.commit();
    return tx.balance();
}

Credits Ledger::debit(const std::string& accountId, Credits amount,
                      LedgerReason reason, const std::string& reference) {
    auto tx = begin(accountId);
    tx.debit(amount, reason, reference);
    tx.commit();
    return tx.balance();
}

Credits Ledger::getBalance(const std::string& accountId) const {
    auto slot = accounts_.find(accountId);
    if (!slot) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->account.creditBalance;
}

std::optional<domain::Account> Ledger::getAccount(const std::string& accountId) const {
    auto slot = accounts_.find(accountId);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->account;
}

std::vector<domain::LedgerEntry> Ledger::getEntries(const std::string& accountId) const {
    auto slot = accounts_.find(accountId);
    if (!slot) {
        return {};
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->entries;
}

domain::LedgerTotals Ledger::totals() const {
    domain::LedgerTotals result;
    {
        std::lock_guard<std::mutex> lock(totalsMutex_);
        result = flows_;
    }
    result.balances = 0;
    for (const auto& slot : accounts_.getAll()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.balances = domain::checked::add(result.balances, slot->account.creditBalance);
    }
    return result;
}

} // namespace arena::application
