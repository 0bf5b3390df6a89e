#pragma once

namespace arena::ports::output {

/**
 * @brief Источник случайности для выбора хода соперника
 *
 * Production: SecureRandomSource (CSPRNG). Значения не выводятся
 * из публичных данных раунда.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /**
     * @brief Равномерное число из [0, 1)
     */
    virtual double nextUnit() = 0;
};

} // namespace arena::ports::output
