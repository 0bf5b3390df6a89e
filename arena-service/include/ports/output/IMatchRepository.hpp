#pragma once

#include "domain/Match.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arena::ports::output {

/**
 * @brief Хранилище матчей (только добавление)
 */
class IMatchRepository {
public:
    virtual ~IMatchRepository() = default;

    virtual void save(const domain::Match& match) = 0;

    virtual std::optional<domain::Match> findById(const std::string& matchId) = 0;

    /**
     * @brief Матчи аккаунта в порядке sequence
     */
    virtual std::vector<domain::Match> findByAccountId(const std::string& accountId) = 0;

    virtual std::size_t countByAccountId(const std::string& accountId) = 0;
};

} // namespace arena::ports::output
