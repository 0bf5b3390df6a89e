#pragma once

#include "ports/output/IMatchRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace arena::adapters::secondary {

/**
 * @brief In-memory реализация репозитория матчей
 *
 * Индекс по аккаунту хранит ID в порядке добавления, то есть по sequence.
 */
class InMemoryMatchRepository : public ports::output::IMatchRepository {
public:
    void save(const domain::Match& match) override {
        matches_.insert(match.id, std::make_shared<domain::Match>(match));

        std::lock_guard<std::mutex> lock(indexMutex_);
        accountMatches_[match.accountId].push_back(match.id);
    }

    std::optional<domain::Match> findById(const std::string& matchId) override {
        auto match = matches_.find(matchId);
        return match ? std::optional(*match) : std::nullopt;
    }

    std::vector<domain::Match> findByAccountId(const std::string& accountId) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = accountMatches_.find(accountId);
            if (it != accountMatches_.end()) {
                ids = it->second;
            }
        }

        std::vector<domain::Match> result;
        result.reserve(ids.size());
        for (const auto& id : ids) {
            if (auto match = matches_.find(id)) {
                result.push_back(*match);
            }
        }
        return result;
    }

    std::size_t countByAccountId(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(indexMutex_);
        auto it = accountMatches_.find(accountId);
        return it == accountMatches_.end() ? 0 : it->second.size();
    }

private:
    ThreadSafeMap<std::string, domain::Match> matches_;
    std::mutex indexMutex_;
    std::unordered_map<std::string, std::vector<std::string>> accountMatches_;
};

} // namespace arena::adapters::secondary
