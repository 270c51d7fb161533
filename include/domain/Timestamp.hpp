#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Временная метка с точностью до микросекунд (как TIMESTAMPTZ)
 *
 * Формат строки: 2026-01-15T10:30:00.123456Z (UTC)
 */
class Timestamp {
public:
    using Clock = std::chrono::system_clock;
    using Micros = std::chrono::microseconds;

    Clock::time_point value;

    Timestamp() : value(std::chrono::time_point_cast<Micros>(Clock::now())) {}

    explicit Timestamp(Clock::time_point tp)
        : value(std::chrono::time_point_cast<Micros>(tp)) {}

    static Timestamp now() {
        return Timestamp(Clock::now());
    }

    /**
     * @brief Разобрать ISO 8601 в UTC, дробная часть опциональна
     * @throws std::invalid_argument при неверном формате
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }

        int64_t micros = 0;
        if (ss.peek() == '.') {
            ss.get();
            int digits = 0;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits < 6) {
                    micros = micros * 10 + (c - '0');
                    ++digits;
                }
            }
            for (; digits < 6; ++digits) {
                micros *= 10;
            }
        }

        auto tp = Clock::from_time_t(timegm(&tm)) + Micros(micros);
        return Timestamp(tp);
    }

    std::string toString() const {
        auto timeT = Clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&timeT, &tm);

        auto micros = std::chrono::duration_cast<Micros>(
            value - Clock::from_time_t(timeT)).count();
        // to_time_t может округлить вверх
        if (micros < 0) {
            timeT -= 1;
            gmtime_r(&timeT, &tm);
            micros += 1000000;
        }

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
};

} // namespace ledger::domain
