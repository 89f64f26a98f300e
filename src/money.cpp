#include "money.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <cctype>
#include <limits>
#include <stdexcept>

using boost::multiprecision::int128_t;

static std::int64_t narrow_or_throw(const int128_t& v, const char* op) {
    if (v > int128_t(std::numeric_limits<std::int64_t>::max()) ||
        v < int128_t(std::numeric_limits<std::int64_t>::min())) {
        throw std::overflow_error(std::string("Money overflow in ") + op);
    }
    return v.convert_to<std::int64_t>();
}

Money Money::from_units(std::int64_t units) {
    return Money(units);
}

Money Money::from_int(long long whole) {
    return Money(narrow_or_throw(int128_t(whole) * kOne, "from_int"));
}

Money Money::parse(const std::string& text) {
    std::size_t i = 0;
    bool neg = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        neg = (text[i] == '-');
        ++i;
    }

    int128_t whole = 0;
    std::size_t int_digits = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        whole = whole * 10 + (text[i] - '0');
        if (whole > int128_t(std::numeric_limits<std::int64_t>::max()))
            throw std::overflow_error("Money overflow parsing '" + text + "'");
        ++int_digits;
        ++i;
    }

    int128_t frac = 0;
    int frac_digits = 0;
    std::size_t seen_frac = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            if (frac_digits < kScale) {
                frac = frac * 10 + (text[i] - '0');
                ++frac_digits;
            }
            ++seen_frac;
            ++i;
        }
    }

    if (i != text.size() || (int_digits == 0 && seen_frac == 0))
        throw std::invalid_argument("not a decimal number: '" + text + "'");

    for (int d = frac_digits; d < kScale; ++d) frac *= 10;

    int128_t units = whole * kOne + frac;
    if (neg) units = -units;
    return Money(narrow_or_throw(units, "parse"));
}

Money Money::operator+(const Money& o) const {
    return Money(narrow_or_throw(int128_t(units_) + o.units_, "+"));
}

Money Money::operator-(const Money& o) const {
    return Money(narrow_or_throw(int128_t(units_) - o.units_, "-"));
}

Money Money::operator-() const {
    return Money(narrow_or_throw(-int128_t(units_), "negate"));
}

Money Money::operator*(const Money& o) const {
    // int128 division truncates toward zero
    int128_t p = int128_t(units_) * o.units_ / kOne;
    return Money(narrow_or_throw(p, "*"));
}

Money Money::operator/(const Money& o) const {
    if (o.units_ == 0) throw std::domain_error("Money division by zero");
    int128_t q = int128_t(units_) * kOne / o.units_;
    return Money(narrow_or_throw(q, "/"));
}

Money Money::round_down(int places) const {
    if (places < 0 || places > kScale)
        throw std::invalid_argument("round_down places must be within 0..8");
    std::int64_t step = 1;
    for (int d = places; d < kScale; ++d) step *= 10;
    return Money(units_ / step * step);
}

std::string Money::to_string() const {
    const bool neg = units_ < 0;
    // go through int128 so that INT64_MIN does not overflow on negation
    int128_t abs_units = neg ? -int128_t(units_) : int128_t(units_);

    int128_t whole = abs_units / kOne;
    std::int64_t frac = (abs_units % kOne).convert_to<std::int64_t>();

    std::string out = neg ? "-" : "";
    out += whole.str();

    if (frac != 0) {
        std::string f = std::to_string(frac);
        f.insert(0, kScale - f.size(), '0');
        while (!f.empty() && f.back() == '0') f.pop_back();
        out += "." + f;
    }
    return out;
}
