#pragma once

#include "ThreadSafeMap.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace arena::application {

/**
 * @brief Мьютекс на каждый аккаунт
 *
 * purchase, playRound и cashout одного аккаунта выполняются строго
 * по очереди; разные аккаунты не конкурируют.
 */
class AccountLockRegistry {
public:
    std::unique_lock<std::mutex> lock(const std::string& accountId) {
        auto mutex = mutexes_.getOrCreate(accountId, [] {
            return std::make_shared<std::mutex>();
        });
        return std::unique_lock<std::mutex>(*mutex);
    }

private:
    ThreadSafeMap<std::string, std::mutex> mutexes_;
};

} // namespace arena::application
