#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace arena::domain {

/**
 * @brief Номер календарного дня UTC (дней с 1970-01-01)
 */
using DayKey = int64_t;

/**
 * @brief Временная метка с миллисекундной точностью
 *
 * Все границы суток считаются в UTC.
 */
struct Timestamp {
    static constexpr int64_t MILLIS_PER_DAY = 86'400'000;

    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Преобразовать в ISO 8601 строку с миллисекундами
     * @return Строка формата "2025-12-16T23:59:59.999Z"
     */
    std::string toString() const {
        int64_t millis = toUnixMillis();
        int64_t seconds = floorDiv(millis, 1000);
        int64_t msPart = millis - seconds * 1000;

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << msPart << 'Z';
        return ss.str();
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(millis))
        ));
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return fromUnixMillis(seconds * 1000);
    }

    /**
     * @brief Номер суток UTC, к которым относится метка
     *
     * 23:59:59.999 и 00:00:00.000 следующего дня дают разные ключи.
     * Для моментов до эпохи округление идёт вниз.
     */
    DayKey utcDayKey() const {
        return floorDiv(toUnixMillis(), MILLIS_PER_DAY);
    }

    Timestamp addMillis(int64_t millis) const {
        return Timestamp(value + std::chrono::milliseconds(millis));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }
};

} // namespace arena::domain
