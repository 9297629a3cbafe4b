#include "domain/Decimal.hpp"
#include <stdexcept>
#include <limits>
#include <cctype>

namespace cpq::domain {

namespace {

using Wide = __int128;

constexpr Wide NANO = Decimal::NANO_FACTOR;

Wide toScaled(const Decimal& d) {
    return static_cast<Wide>(d.units) * NANO + d.nano;
}

Decimal fromScaled(Wide scaled) {
    Wide u = scaled / NANO;
    Wide n = scaled % NANO;
    if (u > std::numeric_limits<int64_t>::max() || u < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    Decimal result;
    result.units = static_cast<int64_t>(u);
    result.nano = static_cast<int32_t>(n);
    return result;
}

// Произведение масштабированных значений, переполнение __int128 -> overflow_error
Wide multiplyChecked(Wide a, Wide b) {
    if (a == 0 || b == 0) return 0;
    const Wide limit = static_cast<Wide>((static_cast<unsigned __int128>(1) << 127) - 1);
    Wide absA = a < 0 ? -a : a;
    Wide absB = b < 0 ? -b : b;
    if (absA > limit / absB) {
        throw std::overflow_error("Decimal overflow");
    }
    return a * b;
}

Wide pow10(int exp) {
    Wide r = 1;
    for (int i = 0; i < exp; ++i) r *= 10;
    return r;
}

// Целочисленное деление с округлением half-even
Wide divideHalfEven(Wide num, Wide den) {
    if (den < 0) {
        num = -num;
        den = -den;
    }
    Wide q = num / den;
    Wide r = num % den;
    if (r == 0) return q;

    Wide twice = (r < 0 ? -r : r) * 2;
    Wide sign = num < 0 ? -1 : 1;
    if (twice > den || (twice == den && q % 2 != 0)) {
        q += sign;
    }
    return q;
}

} // namespace

Decimal::Decimal(int64_t u, int32_t n) {
    *this = fromScaled(static_cast<Wide>(u) * NANO + n);
}

Decimal Decimal::fromString(const std::string& text) {
    if (text.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    Wide intPart = 0;
    size_t intDigits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        intPart = intPart * 10 + (text[pos] - '0');
        if (intPart > std::numeric_limits<int64_t>::max()) {
            throw std::invalid_argument("Decimal out of range: " + text);
        }
        ++pos;
        ++intDigits;
    }
    if (intDigits == 0) {
        throw std::invalid_argument("Invalid decimal: " + text);
    }

    Wide fracPart = 0;
    int fracDigits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (fracDigits == MAX_SCALE) {
                throw std::invalid_argument("Decimal has more than 9 fractional digits: " + text);
            }
            fracPart = fracPart * 10 + (text[pos] - '0');
            ++pos;
            ++fracDigits;
        }
        if (fracDigits == 0) {
            throw std::invalid_argument("Invalid decimal: " + text);
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid decimal: " + text);
    }

    Wide scaled = intPart * NANO + fracPart * pow10(MAX_SCALE - fracDigits);
    return fromScaled(negative ? -scaled : scaled);
}

Decimal Decimal::operator+(const Decimal& other) const {
    return fromScaled(toScaled(*this) + toScaled(other));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return fromScaled(toScaled(*this) - toScaled(other));
}

Decimal Decimal::operator-() const {
    return fromScaled(-toScaled(*this));
}

Decimal Decimal::operator*(const Decimal& other) const {
    return fromScaled(divideHalfEven(multiplyChecked(toScaled(*this), toScaled(other)), NANO));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.isZero()) {
        throw std::domain_error("Decimal division by zero");
    }
    return fromScaled(divideHalfEven(multiplyChecked(toScaled(*this), NANO), toScaled(other)));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

Decimal Decimal::roundHalfEven(int scale) const {
    if (scale < 0 || scale > MAX_SCALE) {
        throw std::invalid_argument("Rounding scale must be within 0..9");
    }
    Wide step = pow10(MAX_SCALE - scale);
    return fromScaled(divideHalfEven(toScaled(*this), step) * step);
}

Decimal Decimal::percentOf(const Decimal& pct) const {
    return fromScaled(divideHalfEven(multiplyChecked(toScaled(*this), toScaled(pct)), NANO * 100));
}

std::string Decimal::toString() const {
    std::string fixed = toFixed(MAX_SCALE);
    size_t end = fixed.find_last_not_of('0');
    if (fixed[end] == '.') {
        return fixed.substr(0, end);
    }
    return fixed.substr(0, end + 1);
}

std::string Decimal::toFixed(int scale) const {
    Decimal rounded = roundHalfEven(scale);
    Wide scaled = toScaled(rounded);
    bool negative = scaled < 0;
    if (negative) scaled = -scaled;

    int64_t whole = static_cast<int64_t>(scaled / NANO);
    int64_t frac = static_cast<int64_t>(scaled % NANO);

    std::string result = negative ? "-" : "";
    result += std::to_string(whole);
    if (scale > 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, MAX_SCALE - digits.size(), '0');
        result += "." + digits.substr(0, scale);
    }
    return result;
}

bool Decimal::operator<(const Decimal& other) const {
    return toScaled(*this) < toScaled(other);
}

} // namespace cpq::domain
