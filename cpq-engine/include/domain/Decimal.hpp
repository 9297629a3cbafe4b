// include/domain/Decimal.hpp
#pragma once

#include <string>
#include <cstdint>
#include <ostream>

namespace cpq::domain {

/**
 * @brief Точное десятичное значение с фиксированной точкой
 *
 * Хранит целую часть в units и дробную в nano (10^-9), как денежные
 * значения брокерского API. Знак units и nano всегда совпадает.
 * Двоичная плавающая точка не используется ни при создании, ни в арифметике.
 */
class Decimal {
public:
    static constexpr int32_t NANO_FACTOR = 1000000000;
    static constexpr int MAX_SCALE = 9;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)

    Decimal() = default;

    /// Нормализует пару units/nano к одному знаку
    Decimal(int64_t u, int32_t n);

    static Decimal fromInt(int64_t value) { return Decimal(value, 0); }

    /**
     * @brief Разобрать каноническую десятичную строку ("-12.345")
     * @throws std::invalid_argument при неверном формате или более 9 знаках после точки
     */
    static Decimal fromString(const std::string& text);

    static Decimal zero() { return Decimal(); }
    static Decimal hundred() { return Decimal(100, 0); }

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator-() const;

    /// Произведение; округление half-even на 9-м знаке
    Decimal operator*(const Decimal& other) const;

    /**
     * @brief Деление с округлением half-even на 9-м знаке
     * @throws std::domain_error при делении на ноль
     */
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    /// Округление half-even до scale знаков (0..9)
    Decimal roundHalfEven(int scale) const;

    /// value * pct / 100
    Decimal percentOf(const Decimal& pct) const;

    Decimal abs() const { return isNegative() ? -*this : *this; }
    bool isZero() const { return units == 0 && nano == 0; }
    bool isNegative() const { return units < 0 || nano < 0; }
    bool isInteger() const { return nano == 0; }

    /// Каноническая форма: без лишних нулей ("10800", "0.5", "-3.25")
    std::string toString() const;

    /// Ровно scale знаков после точки ("10800.00")
    std::string toFixed(int scale) const;

    bool operator==(const Decimal& other) const { return units == other.units && nano == other.nano; }
    bool operator!=(const Decimal& other) const { return !(*this == other); }
    bool operator<(const Decimal& other) const;
    bool operator>(const Decimal& other) const { return other < *this; }
    bool operator<=(const Decimal& other) const { return !(other < *this); }
    bool operator>=(const Decimal& other) const { return !(*this < other); }
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.toString();
}

inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

} // namespace cpq::domain
