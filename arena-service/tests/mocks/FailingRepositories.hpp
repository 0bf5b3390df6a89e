#pragma once

#include "adapters/secondary/persistence/InMemoryMatchRepository.hpp"
#include "adapters/secondary/persistence/InMemoryWalletOperationRepository.hpp"
#include <atomic>
#include <stdexcept>

namespace arena::tests {

/**
 * @brief In-memory репозиторий матчей, который по команде отказывает в записи
 */
class FailingMatchRepository : public adapters::secondary::InMemoryMatchRepository {
public:
    void setFailing(bool failing) { failing_ = failing; }

    void save(const domain::Match& match) override {
        if (failing_) {
            throw std::runtime_error("storage unavailable");
        }
        InMemoryMatchRepository::save(match);
    }

private:
    std::atomic<bool> failing_{false};
};

/**
 * @brief In-memory репозиторий операций кошелька с управляемым отказом записи
 */
class FailingWalletOperationRepository : public adapters::secondary::InMemoryWalletOperationRepository {
public:
    void setFailing(bool failing) { failing_ = failing; }

    void save(const domain::WalletOperation& operation) override {
        if (failing_) {
            throw std::runtime_error("storage unavailable");
        }
        InMemoryWalletOperationRepository::save(operation);
    }

private:
    std::atomic<bool> failing_{false};
};

} // namespace arena::tests
