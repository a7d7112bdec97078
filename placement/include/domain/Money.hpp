#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace placement::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9),
 * все арифметические операции выполняются в целых числах.
 * Знаки units и nano всегда совпадают.
 *
 * Выход за диапазон int64 в нано-единицах - std::overflow_error,
 * сложение разных валют - std::invalid_argument.
 */
class Money {
public:
    static constexpr int64_t NANOS_PER_UNIT = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)
    std::string currency = "USD";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "USD")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "USD") {
        return fromNanos(std::llround(value * NANOS_PER_UNIT), cur);
    }

    static Money fromNanos(int64_t totalNanos, const std::string& cur = "USD") {
        return Money(totalNanos / NANOS_PER_UNIT,
                     static_cast<int32_t>(totalNanos % NANOS_PER_UNIT),
                     cur);
    }

    static Money zero(const std::string& cur = "USD") {
        return Money(0, 0, cur);
    }

    int64_t toNanos() const {
        constexpr int64_t maxUnits =
            (std::numeric_limits<int64_t>::max() - (NANOS_PER_UNIT - 1)) / NANOS_PER_UNIT;
        if (units > maxUnits || units < -maxUnits) {
            throw std::overflow_error("Money out of range: " + std::to_string(units) + " units");
        }
        return units * NANOS_PER_UNIT + nano;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isNegative() const {
        return units < 0 || nano < 0;
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    Money operator+(const Money& other) const {
        requireSameCurrency(other);
        return fromNanos(checkedAdd(toNanos(), other.toNanos()), currency);
    }

    Money operator-(const Money& other) const {
        requireSameCurrency(other);
        int64_t rhs = other.toNanos();
        if (rhs == std::numeric_limits<int64_t>::min()) {
            throw std::overflow_error("Money subtraction overflow");
        }
        return fromNanos(checkedAdd(toNanos(), -rhs), currency);
    }

    Money operator*(int64_t multiplier) const {
        int64_t nanos = toNanos();
        if (nanos != 0 && multiplier != 0) {
            bool overflow = multiplier == std::numeric_limits<int64_t>::min();
            if (!overflow) {
                int64_t limit = std::numeric_limits<int64_t>::max() /
                                (multiplier < 0 ? -multiplier : multiplier);
                overflow = nanos > limit || nanos < -limit;
            }
            if (overflow) {
                throw std::overflow_error("Money multiplication overflow: " + toString() +
                                          " * " + std::to_string(multiplier));
            }
        }
        return fromNanos(nanos * multiplier, currency);
    }

    /**
     * @brief Умножить на дробный коэффициент (налог, скидка)
     *
     * Результат округляется до ближайшей нано-единицы.
     */
    Money multiplyByRate(double rate) const {
        double product = static_cast<double>(toNanos()) * rate;
        // 2^63: всё, что не меньше, в int64 не помещается
        if (!(std::fabs(product) < 9223372036854775808.0)) {
            throw std::overflow_error("Money rate multiplication overflow: " + toString());
        }
        return fromNanos(std::llround(product), currency);
    }

    bool operator<(const Money& other) const {
        return toNanos() < other.toNanos();
    }

    bool operator>(const Money& other) const {
        return toNanos() > other.toNanos();
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    /**
     * @brief Строка вида "33.00 USD" (округление до центов)
     */
    std::string toString() const {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(2) << toDouble() << " " << currency;
        return ss.str();
    }

private:
    void requireSameCurrency(const Money& other) const {
        if (currency != other.currency) {
            throw std::invalid_argument("Currency mismatch: " + currency + " vs " + other.currency);
        }
    }

    static int64_t checkedAdd(int64_t a, int64_t b) {
        if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
            (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
            throw std::overflow_error("Money addition overflow");
        }
        return a + b;
    }
};

} // namespace placement::domain
