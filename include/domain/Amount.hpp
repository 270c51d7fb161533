#pragma once

#include <string>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Денежная сумма с фиксированной точкой
 *
 * Хранится как целое число минимальных единиц (1/100), как копейки
 * в балансах брокера. Плавающая точка не используется нигде:
 * ни при разборе, ни при суммировании.
 *
 * Текстовый формат: [-]DIGITS[.D[D]]
 * Пример: "100.00" = {minorUnits: 10000}
 */
struct Amount {
    static constexpr int SCALE = 2;
    static constexpr int64_t FACTOR = 100;

    int64_t minorUnits = 0;     ///< Сумма в сотых долях

    Amount() = default;

    static Amount fromMinorUnits(int64_t units) {
        Amount a;
        a.minorUnits = units;
        return a;
    }

    /**
     * @brief Разобрать строку с фиксированной точкой
     * @throws std::invalid_argument при неверном формате или переполнении
     */
    static Amount parse(const std::string& text) {
        if (text.empty()) {
            throw std::invalid_argument("Amount is empty");
        }

        size_t pos = 0;
        bool negative = false;
        if (text[pos] == '-') {
            negative = true;
            ++pos;
        }

        int64_t whole = 0;
        size_t wholeDigits = 0;
        while (pos < text.size() && isDigit(text[pos])) {
            const int digit = text[pos] - '0';
            if (whole > (MAX_UNITS - digit) / 10) {
                throw std::invalid_argument("Amount is too large: " + text);
            }
            whole = whole * 10 + digit;
            ++wholeDigits;
            ++pos;
        }
        if (wholeDigits == 0) {
            throw std::invalid_argument("Invalid amount: " + text);
        }

        int64_t fraction = 0;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t fractionDigits = 0;
            while (pos < text.size() && isDigit(text[pos])) {
                if (fractionDigits == static_cast<size_t>(SCALE)) {
                    throw std::invalid_argument(
                        "Amount has more than 2 fractional digits: " + text);
                }
                fraction = fraction * 10 + (text[pos] - '0');
                ++fractionDigits;
                ++pos;
            }
            if (fractionDigits == 0) {
                throw std::invalid_argument("Invalid amount: " + text);
            }
            if (fractionDigits == 1) {
                fraction *= 10;
            }
        }

        if (pos != text.size()) {
            throw std::invalid_argument("Invalid amount: " + text);
        }

        if (whole > (MAX_UNITS - fraction) / FACTOR) {
            throw std::invalid_argument("Amount is too large: " + text);
        }
        const int64_t units = whole * FACTOR + fraction;
        return fromMinorUnits(negative ? -units : units);
    }

    /**
     * @brief Каноническая строка, всегда два знака после точки
     */
    std::string toString() const {
        // Модуль через uint64_t, чтобы не переполниться на INT64_MIN
        uint64_t abs = minorUnits < 0
            ? static_cast<uint64_t>(-(minorUnits + 1)) + 1
            : static_cast<uint64_t>(minorUnits);

        std::string fraction = std::to_string(abs % FACTOR);
        if (fraction.size() < static_cast<size_t>(SCALE)) {
            fraction.insert(0, static_cast<size_t>(SCALE) - fraction.size(), '0');
        }

        std::string result = minorUnits < 0 ? "-" : "";
        result += std::to_string(abs / FACTOR);
        result += ".";
        result += fraction;
        return result;
    }

    Amount operator+(const Amount& other) const {
        if ((other.minorUnits > 0 && minorUnits > MAX_UNITS - other.minorUnits) ||
            (other.minorUnits < 0 && minorUnits < MIN_UNITS - other.minorUnits)) {
            throw std::overflow_error("Amount overflow");
        }
        return fromMinorUnits(minorUnits + other.minorUnits);
    }

    Amount operator-(const Amount& other) const {
        if ((other.minorUnits < 0 && minorUnits > MAX_UNITS + other.minorUnits) ||
            (other.minorUnits > 0 && minorUnits < MIN_UNITS + other.minorUnits)) {
            throw std::overflow_error("Amount overflow");
        }
        return fromMinorUnits(minorUnits - other.minorUnits);
    }

    Amount& operator+=(const Amount& other) {
        *this = *this + other;
        return *this;
    }

    Amount& operator-=(const Amount& other) {
        *this = *this - other;
        return *this;
    }

    Amount operator-() const {
        return fromMinorUnits(0) - *this;
    }

    bool operator==(const Amount& other) const { return minorUnits == other.minorUnits; }
    bool operator!=(const Amount& other) const { return minorUnits != other.minorUnits; }
    bool operator<(const Amount& other) const { return minorUnits < other.minorUnits; }
    bool operator>(const Amount& other) const { return minorUnits > other.minorUnits; }
    bool operator<=(const Amount& other) const { return minorUnits <= other.minorUnits; }
    bool operator>=(const Amount& other) const { return minorUnits >= other.minorUnits; }

    bool isZero() const { return minorUnits == 0; }
    bool isPositive() const { return minorUnits > 0; }
    bool isNegative() const { return minorUnits < 0; }

private:
    static constexpr int64_t MAX_UNITS = std::numeric_limits<int64_t>::max();
    static constexpr int64_t MIN_UNITS = std::numeric_limits<int64_t>::min();

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }
};

} // namespace ledger::domain
