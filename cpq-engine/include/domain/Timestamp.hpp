// include/domain/Timestamp.hpp
#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>
#include <stdexcept>

namespace cpq::domain {

/**
 * @brief Момент времени UTC в формате ISO 8601
 *
 * Движок никогда не берёт текущее время сам: все метки приходят из событий,
 * поэтому повторное проигрывание журнала даёт тот же результат.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::time_point{}) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<std::chrono::seconds>(
            std::chrono::system_clock::now()));
    }

    /**
     * @brief Разобрать "2025-12-16T10:30:00Z" или дату "2025-12-16"
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        if (isoString.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
            if (!ss.fail()) {
                char zone = '\0';
                ss >> zone;
                if (zone != 'Z') {
                    throw std::invalid_argument("Timestamp must be UTC (Z): " + isoString);
                }
            }
        }

        if (ss.fail()) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /// Только дата: "2025-12-16"
    std::string toDateString() const {
        return toString().substr(0, 10);
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    Timestamp addDays(int64_t days) const {
        return addHours(days * 24);
    }

    /// Полных суток до other (отрицательно, если other раньше)
    int64_t daysUntil(const Timestamp& other) const {
        return (other.toUnixSeconds() - toUnixSeconds()) / 86400;
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace cpq::domain
