#pragma once

#include "domain/WalletOperation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace arena::ports::output {

/**
 * @brief Хранилище покупок и выводов (только добавление)
 */
class IWalletOperationRepository {
public:
    virtual ~IWalletOperationRepository() = default;

    virtual void save(const domain::WalletOperation& operation) = 0;

    virtual std::optional<domain::WalletOperation> findById(const std::string& operationId) = 0;

    virtual std::vector<domain::WalletOperation> findByAccountId(const std::string& accountId) = 0;
};

} // namespace arena::ports::output
