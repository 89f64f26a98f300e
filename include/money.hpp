#pragma once
#include <cstdint>
#include <ostream>
#include <string>

// Exact decimal with 8 fractional digits (1 unit = 1e-8).
// Prices, quantities and percentages all go through this type so that
// comparisons like "ask < stop price" never suffer from binary drift.
class Money {
public:
    static constexpr int kScale = 8;
    static constexpr std::int64_t kOne = 100000000;

    Money() = default;

    static Money from_units(std::int64_t units);
    static Money from_int(long long whole);

    // "[-]digits[.digits]". Digits past the 8th decimal are truncated.
    // Throws std::invalid_argument on anything else.
    static Money parse(const std::string& text);

    std::int64_t units() const { return units_; }

    bool is_zero() const { return units_ == 0; }
    bool is_negative() const { return units_ < 0; }
    bool is_positive() const { return units_ > 0; }

    Money operator+(const Money& o) const;
    Money operator-(const Money& o) const;
    Money operator-() const;

    // Product truncated toward zero at 8 decimals.
    Money operator*(const Money& o) const;

    // Quotient rounded toward zero (never rounds a buy quantity up).
    // Throws std::domain_error on division by zero.
    Money operator/(const Money& o) const;

    // Truncate toward zero to `places` fractional digits (0..8).
    Money round_down(int places) const;

    bool operator==(const Money& o) const { return units_ == o.units_; }
    bool operator!=(const Money& o) const { return units_ != o.units_; }
    bool operator<(const Money& o) const { return units_ < o.units_; }
    bool operator<=(const Money& o) const { return units_ <= o.units_; }
    bool operator>(const Money& o) const { return units_ > o.units_; }
    bool operator>=(const Money& o) const { return units_ >= o.units_; }

    // Shortest plain decimal form: "101.5", "0.00333333", "-3".
    std::string to_string() const;

private:
    explicit Money(std::int64_t units) : units_(units) {}

    std::int64_t units_ = 0;
};

inline Money max(const Money& a, const Money& b) { return a < b ? b : a; }

inline std::ostream& operator<<(std::ostream& os, const Money& m) {
    return os << m.to_string();
}
