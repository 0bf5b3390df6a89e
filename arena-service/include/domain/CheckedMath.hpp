#pragma once

#include "ArenaError.hpp"
#include <cstdint>
#include <limits>
#include <string>

namespace arena::domain {

/**
 * @brief Количество кредитов в минимальных единицах
 */
using Credits = int64_t;

/**
 * @brief Направление округления при целочисленном делении
 *
 * UP - для суммы, которую обязан заплатить пользователь;
 * DOWN - для суммы, которую платформа выплачивает.
 */
enum class Rounding { UP, DOWN };

namespace checked {

inline int64_t add(int64_t a, int64_t b) {
    int64_t result = 0;
    if (__builtin_add_overflow(a, b, &result)) {
        throw InvariantViolation("int64 overflow in " + std::to_string(a) + " + " + std::to_string(b));
    }
    return result;
}

inline int64_t sub(int64_t a, int64_t b) {
    int64_t result = 0;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw InvariantViolation("int64 overflow in " + std::to_string(a) + " - " + std::to_string(b));
    }
    return result;
}

inline int64_t mul(int64_t a, int64_t b) {
    int64_t result = 0;
    if (__builtin_mul_overflow(a, b, &result)) {
        throw InvariantViolation("int64 overflow in " + std::to_string(a) + " * " + std::to_string(b));
    }
    return result;
}

/**
 * @brief 10^exp без переполнения (exp в диапазоне 0..18)
 */
inline int64_t pow10(int exp) {
    if (exp < 0 || exp > 18) {
        throw InvariantViolation("pow10 exponent out of range: " + std::to_string(exp));
    }
    int64_t result = 1;
    for (int i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

/**
 * @brief a * b / divisor с 128-битным промежуточным результатом
 *
 * Аргументы неотрицательные, divisor > 0.
 */
inline int64_t mulDiv(int64_t a, int64_t b, int64_t divisor, Rounding rounding) {
    if (a < 0 || b < 0 || divisor <= 0) {
        throw InvariantViolation("mulDiv expects non-negative operands and positive divisor");
    }
    using u128 = unsigned __int128;
    u128 product = static_cast<u128>(a) * static_cast<u128>(b);
    u128 quotient = product / static_cast<u128>(divisor);
    if (rounding == Rounding::UP && product % static_cast<u128>(divisor) != 0) {
        ++quotient;
    }
    if (quotient > static_cast<u128>(std::numeric_limits<int64_t>::max())) {
        throw InvariantViolation("mulDiv result does not fit into int64");
    }
    return static_cast<int64_t>(quotient);
}

} // namespace checked

} // namespace arena::domain
