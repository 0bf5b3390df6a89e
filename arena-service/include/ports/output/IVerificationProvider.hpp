#pragma once

#include <string>

namespace arena::ports::output {

/**
 * @brief Внешняя проверка личности/возраста игрока
 *
 * Алгоритм проверки вне системы, потребляется как булев признак.
 */
class IVerificationProvider {
public:
    virtual ~IVerificationProvider() = default;

    virtual bool isVerified(const std::string& accountId) = 0;
};

} // namespace arena::ports::output
