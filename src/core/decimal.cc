/**
 * @file decimal.cc
 * @brief 定点小数实现
 */

#include "core/decimal.h"

#include <cctype>

namespace core {

namespace {

// 128 位整数除法, 结果四舍五入 (远离零)
int64_t div_round(__int128 num, __int128 den) {
    if (den == 0) return 0;
    bool negative = (num < 0) != (den < 0);
    if (num < 0) num = -num;
    if (den < 0) den = -den;
    __int128 q = num / den;
    __int128 r = num % den;
    if (r * 2 >= den) {
        ++q;
    }
    return static_cast<int64_t>(negative ? -q : q);
}

} // namespace

Decimal Decimal::from_ratio(int64_t num, int64_t den) {
    return Decimal(div_round(static_cast<__int128>(num) * SCALE, den));
}

std::optional<Decimal> Decimal::parse(const std::string& text) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    __int128 int_part = 0;
    size_t int_digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        int_part = int_part * 10 + (text[pos] - '0');
        if (int_part > INT64_MAX / SCALE) return std::nullopt;
        ++pos;
        ++int_digits;
    }

    __int128 frac = 0;
    int frac_digits = 0;
    bool round_up = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (frac_digits < DIGITS) {
                frac = frac * 10 + (text[pos] - '0');
                ++frac_digits;
            } else if (frac_digits == DIGITS) {
                round_up = (text[pos] - '0') >= 5;
                ++frac_digits;
            }
            ++pos;
        }
    }

    if (pos != text.size() || (int_digits == 0 && frac_digits == 0)) {
        return std::nullopt;
    }

    for (int i = frac_digits; i < DIGITS; ++i) {
        frac *= 10;
    }
    __int128 raw = int_part * SCALE + frac + (round_up ? 1 : 0);
    return Decimal(static_cast<int64_t>(negative ? -raw : raw));
}

int64_t Decimal::round_to_int() const {
    return div_round(raw_, SCALE);
}

Decimal Decimal::round_to_half() const {
    // x2 -> 取整 -> /2
    int64_t doubled = div_round(static_cast<__int128>(raw_) * 2, SCALE);
    return Decimal(doubled * SCALE / 2);
}

std::string Decimal::to_string() const {
    int64_t value = raw_ < 0 ? -raw_ : raw_;
    std::string out = raw_ < 0 ? "-" : "";
    out += std::to_string(value / SCALE);

    std::string frac = std::to_string(value % SCALE);
    frac.insert(0, DIGITS - frac.size(), '0');
    while (frac.size() > 1 && frac.back() == '0') {
        frac.pop_back();
    }
    out += "." + frac;
    return out;
}

Decimal Decimal::operator*(const Decimal& o) const {
    return Decimal(div_round(static_cast<__int128>(raw_) * o.raw_, SCALE));
}

Decimal Decimal::operator/(const Decimal& o) const {
    return Decimal(div_round(static_cast<__int128>(raw_) * SCALE, o.raw_));
}

Decimal min(const Decimal& a, const Decimal& b) {
    return b < a ? b : a;
}

Decimal max(const Decimal& a, const Decimal& b) {
    return a < b ? b : a;
}

} // namespace core
