#pragma once

#include "ports/output/IRandomSource.hpp"

namespace arena::adapters::secondary {

/**
 * @brief CSPRNG на OpenSSL RAND_bytes
 *
 * 53 случайных бита превращаются в double из [0, 1).
 */
class SecureRandomSource : public ports::output::IRandomSource {
public:
    /**
     * @throws std::runtime_error если генератор OpenSSL не готов
     */
    double nextUnit() override;
};

} // namespace arena::adapters::secondary
