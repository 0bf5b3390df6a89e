#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace arena::utils {

/**
 * @brief Генератор идентификаторов матчей и операций кошелька
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    /**
     * @brief ID с префиксом: "match-1a2b3c4d5e6f7a8b", "wop-..."
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::uniform_int_distribution<uint64_t> dist;
        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(engine());
        return ss.str();
    }

private:
    static std::mt19937_64& engine() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        return gen;
    }
};

} // namespace arena::utils
