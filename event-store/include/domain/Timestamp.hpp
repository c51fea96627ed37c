// include/domain/Timestamp.hpp
#pragma once

#include <string>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace eventstore::domain {

/**
 * @brief Timestamp in ISO 8601 format (UTC, millisecond precision)
 *
 * Хранится как system_clock::time_point, усечённый до миллисекунд,
 * чтобы значение совпадало после записи в БД и чтения обратно.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    /**
     * @brief Create Timestamp with current time
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Create Timestamp from ISO 8601 string
     * @param isoString "2025-12-16T10:30:00Z" or "2025-12-16T10:30:00.123Z"
     * @throws std::invalid_argument if the string is not a valid timestamp
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(static_cast<unsigned char>(ss.peek()))) {
                char c = static_cast<char>(ss.get());
                if (digits < 3) {
                    millis = millis * 10 + (c - '0');
                }
                ++digits;
            }
            for (; digits < 3; ++digits) {
                millis *= 10;
            }
        }

        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromUnixMillis(seconds * 1000 + millis);
    }

    /**
     * @brief Convert to ISO 8601 string with milliseconds
     */
    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);

        auto millis = toUnixMillis() % 1000;
        if (millis < 0) {
            millis += 1000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Get Unix timestamp (seconds since 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Get Unix timestamp in milliseconds
     */
    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)
        ));
    }

    Timestamp plusMillis(int64_t millis) const {
        return fromUnixMillis(toUnixMillis() + millis);
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }
};

} // namespace eventstore::domain
