/**
 * @file decimal.h
 * @brief 定点小数 - 假期天数、缺勤比例、账户余额使用
 * @details 64 位尾数, 固定 6 位小数; 乘除使用 128 位中间值,
 *          末位按 "四舍五入 (远离零)" 处理, 保证跨平台结果一致。
 */

#ifndef CORE_DECIMAL_H
#define CORE_DECIMAL_H

#include <cstdint>
#include <optional>
#include <string>

namespace core {

class Decimal {
public:
    static constexpr int DIGITS = 6;
    static constexpr int64_t SCALE = 1000000;

    constexpr Decimal() = default;

    static constexpr Decimal from_raw(int64_t raw) { return Decimal(raw); }
    static constexpr Decimal from_int(int64_t v) { return Decimal(v * SCALE); }

    // num / den, den 为 0 时返回 0
    static Decimal from_ratio(int64_t num, int64_t den);

    // 解析 "30", "-1.5", "0.25"; 超过 6 位的小数按四舍五入截断
    static std::optional<Decimal> parse(const std::string& text);

    constexpr int64_t raw() const { return raw_; }

    bool is_zero() const { return raw_ == 0; }
    bool is_positive() const { return raw_ > 0; }
    bool is_negative() const { return raw_ < 0; }

    // 四舍五入到整数 (远离零)
    int64_t round_to_int() const;

    // 四舍五入到 0.5 (远离零)
    Decimal round_to_half() const;

    // 最短表示, 至少保留一位小数: "15.0", "17.5", "10.416667"
    std::string to_string() const;

    Decimal operator+(const Decimal& o) const { return Decimal(raw_ + o.raw_); }
    Decimal operator-(const Decimal& o) const { return Decimal(raw_ - o.raw_); }
    Decimal operator-() const { return Decimal(-raw_); }
    Decimal operator*(const Decimal& o) const;
    // 除数为 0 时结果为 0, 调用方负责事先检查
    Decimal operator/(const Decimal& o) const;

    Decimal& operator+=(const Decimal& o) { raw_ += o.raw_; return *this; }
    Decimal& operator-=(const Decimal& o) { raw_ -= o.raw_; return *this; }

    bool operator==(const Decimal& o) const { return raw_ == o.raw_; }
    bool operator!=(const Decimal& o) const { return raw_ != o.raw_; }
    bool operator<(const Decimal& o) const { return raw_ < o.raw_; }
    bool operator<=(const Decimal& o) const { return raw_ <= o.raw_; }
    bool operator>(const Decimal& o) const { return raw_ > o.raw_; }
    bool operator>=(const Decimal& o) const { return raw_ >= o.raw_; }

private:
    constexpr explicit Decimal(int64_t raw) : raw_(raw) {}

    int64_t raw_ = 0;
};

Decimal min(const Decimal& a, const Decimal& b);
Decimal max(const Decimal& a, const Decimal& b);

} // namespace core

#endif // CORE_DECIMAL_H
