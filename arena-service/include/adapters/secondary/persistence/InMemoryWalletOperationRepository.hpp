#pragma once

#include "ports/output/IWalletOperationRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace arena::adapters::secondary {

/**
 * @brief In-memory реализация репозитория операций кошелька
 */
class InMemoryWalletOperationRepository : public ports::output::IWalletOperationRepository {
public:
    void save(const domain::WalletOperation& operation) override {
        operations_.insert(operation.id, std::make_shared<domain::WalletOperation>(operation));

        std::lock_guard<std::mutex> lock(indexMutex_);
        accountOperations_[operation.accountId].push_back(operation.id);
    }

    std::optional<domain::WalletOperation> findById(const std::string& operationId) override {
        auto operation = operations_.find(operationId);
        return operation ? std::optional(*operation) : std::nullopt;
    }

    /**
     * @brief Операции аккаунта в порядке проведения
     */
    std::vector<domain::WalletOperation> findByAccountId(const std::string& accountId) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = accountOperations_.find(accountId);
            if (it != accountOperations_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::WalletOperation> result;
        for (const auto& id : ids) {
            if (auto operation = operations_.find(id)) {
                result.push_back(*operation);
            }
        }
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::WalletOperation> operations_;
    std::mutex indexMutex_;
    std::unordered_map<std::string, std::vector<std::string>> accountOperations_;
};

} // namespace arena::adapters::secondary
