#pragma once

#include "ports/output/IVerificationProvider.hpp"
#include <mutex>
#include <set>
#include <string>

namespace arena::adapters::secondary {

/**
 * @brief Проверка по списку подтверждённых аккаунтов
 *
 * Замена внешнего KYC-провайдера для симулятора.
 */
class AllowListVerificationProvider : public ports::output::IVerificationProvider {
public:
    bool isVerified(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return verified_.count(accountId) > 0;
    }

    void allow(const std::string& accountId) {
        std::lock_guard<std::mutex> lock(mutex_);
        verified_.insert(accountId);
    }

    void revoke(const std::string& accountId) {
        std::lock_guard<std::mutex> lock(mutex_);
        verified_.erase(accountId);
    }

private:
    std::mutex mutex_;
    std::set<std::string> verified_;
};

} // namespace arena::adapters::secondary
