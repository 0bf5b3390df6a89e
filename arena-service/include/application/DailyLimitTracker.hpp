#pragma once

#include "application/ConfigRegistry.hpp"
#include "domain/ArenaError.hpp"
#include "domain/DailyCounter.hpp"
#include "domain/Timestamp.hpp"
#include "ThreadSafeMap.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace arena::application {

/**
 * @brief Суточные лимиты участия (раунды и сумма ставок) по UTC
 *
 * Схема reserve/commit/release: резерв увеличивает оба счётчика сразу,
 * откат возвращает их ровно на ту же величину.
 *
 * @example
 * ```cpp
 * auto reservation = limits.reserve("acc-1", 5, clock->now());
 * // ... списание ставки, ход соперника
 * reservation.commit();  // без commit счётчики вернутся при выходе из scope
 * ```
 */
class DailyLimitTracker {
public:
    /**
     * @brief RAII-резерв суточного лимита
     */
    class Reservation {
    public:
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        Reservation(Reservation&& other) noexcept
            : tracker_(other.tracker_)
            , accountId_(std::move(other.accountId_))
            , day_(other.day_)
            , stake_(other.stake_)
            , active_(other.active_)
        {
            other.active_ = false;
        }

        Reservation& operator=(Reservation&&) = delete;

        /**
         * Деструктор не бросает: он может выполняться при раскрутке стека.
         * Ошибка отката пишется в лог и учитывается в releaseFailures().
         */
        ~Reservation() noexcept {
            if (!active_) {
                return;
            }
            try {
                tracker_->release(*this);
            } catch (const std::exception& e) {
                ++tracker_->releaseFailures_;
                std::cerr << "[DailyLimitTracker] Failed to release reservation for " << accountId_
                          << ": " << e.what() << std::endl;
            }
        }

        void commit() { active_ = false; }

        bool active() const { return active_; }
        const std::string& accountId() const { return accountId_; }
        domain::DayKey day() const { return day_; }
        domain::Credits stake() const { return stake_; }

    private:
        friend class DailyLimitTracker;

        Reservation(DailyLimitTracker* tracker, std::string accountId, domain::DayKey day, domain::Credits stake)
            : tracker_(tracker), accountId_(std::move(accountId)), day_(day), stake_(stake) {}

        DailyLimitTracker* tracker_;
        std::string accountId_;
        domain::DayKey day_;
        domain::Credits stake_;
        bool active_ = true;
    };

    explicit DailyLimitTracker(std::shared_ptr<ConfigRegistry> config)
        : config_(std::move(config)) {}

    /**
     * @brief Проверить лимиты и зарезервировать раунд на сутки момента now
     *
     * @throws ArenaException(DailyRoundLimitExceeded | DailyWagerLimitExceeded),
     *         счётчики при этом не меняются
     */
    Reservation reserve(const std::string& accountId, domain::Credits stake, const domain::Timestamp& now) {
        if (stake <= 0) {
            throw domain::ArenaException(domain::ErrorCode::InvalidStake,
                "stake must be positive, got " + std::to_string(stake));
        }
        auto cfg = config_->get();
        domain::DayKey day = now.utcDayKey();
        auto slot = slotFor(accountId, day);

        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& counter = slot->counter;
        if (counter.roundsPlayed >= cfg.maxDailyRounds) {
            throw domain::ArenaException(domain::ErrorCode::DailyRoundLimitExceeded,
                accountId + " played " + std::to_string(counter.roundsPlayed) + " rounds today");
        }
        domain::Credits wagered = domain::checked::add(counter.creditsWagered, stake);
        if (wagered > cfg.maxDailyWager) {
            throw domain::ArenaException(domain::ErrorCode::DailyWagerLimitExceeded,
                accountId + " would wager " + std::to_string(wagered) + " > " + std::to_string(cfg.maxDailyWager));
        }
        counter.roundsPlayed += 1;
        counter.creditsWagered = wagered;
        return Reservation(this, accountId, day, stake);
    }

    /**
     * @brief Вернуть зарезервированное (откат раунда)
     */
    void release(Reservation& reservation) {
        if (!reservation.active_) {
            return;
        }
        reservation.active_ = false;

        auto slot = counters_.find(keyOf(reservation.accountId_, reservation.day_));
        if (!slot) {
            throw domain::InvariantViolation("release of unknown daily counter " + reservation.accountId_);
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& counter = slot->counter;
        if (counter.roundsPlayed < 1 || counter.creditsWagered < reservation.stake_) {
            throw domain::InvariantViolation("daily counter underflow for " + reservation.accountId_);
        }
        counter.roundsPlayed -= 1;
        counter.creditsWagered -= reservation.stake_;
    }

    /**
     * @brief Сколько откатов из деструктора Reservation завершились ошибкой
     */
    uint64_t releaseFailures() const { return releaseFailures_.load(); }

    /**
     * @brief Счётчики аккаунта за сутки (нулевые, если записей нет)
     */
    domain::DailyCounter getCounter(const std::string& accountId, domain::DayKey day) const {
        auto slot = counters_.find(keyOf(accountId, day));
        if (!slot) {
            return domain::DailyCounter{accountId, day, 0, 0};
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->counter;
    }

private:
    struct CounterSlot {
        std::mutex mutex;
        domain::DailyCounter counter;
    };

    std::shared_ptr<ConfigRegistry> config_;
    ThreadSafeMap<std::string, CounterSlot> counters_;
    std::atomic<uint64_t> releaseFailures_{0};

    static std::string keyOf(const std::string& accountId, domain::DayKey day) {
        return accountId + "@" + std::to_string(day);
    }

    std::shared_ptr<CounterSlot> slotFor(const std::string& accountId, domain::DayKey day) {
        return counters_.getOrCreate(keyOf(accountId, day), [&] {
            auto slot = std::make_shared<CounterSlot>();
            slot->counter = domain::DailyCounter{accountId, day, 0, 0};
            return slot;
        });
    }
};

} // namespace arena::application
