/**
 * @file codes.h
 * @brief 枚举 <-> 字符串编码, 只在数据库与 JSON 边界使用
 */

#ifndef CORE_CODES_H
#define CORE_CODES_H

#include <optional>
#include <string>
#include <vector>

#include "core/time_types.h"

namespace core {

const char* to_string(PlanKind v);
const char* to_string(BookingCategory v);
const char* to_string(PairKind v);
const char* to_string(RoundingMode v);
const char* to_string(BreakKind v);
const char* to_string(NoBookingPolicy v);
const char* to_string(DayKind v);
const char* to_string(AbsenceKind v);
const char* to_string(ShiftMatch v);
const char* to_string(CreditType v);
const char* to_string(AccountKind v);
const char* to_string(TransitionStatus v);
const char* to_string(ErrorCode v);
const char* to_string(WarningCode v);

std::optional<PlanKind> parse_plan_kind(const std::string& s);
std::optional<BookingCategory> parse_booking_category(const std::string& s);
std::optional<RoundingMode> parse_rounding_mode(const std::string& s);
std::optional<BreakKind> parse_break_kind(const std::string& s);
std::optional<NoBookingPolicy> parse_no_booking_policy(const std::string& s);
std::optional<DayKind> parse_day_kind(const std::string& s);
std::optional<AbsenceKind> parse_absence_kind(const std::string& s);
std::optional<CreditType> parse_credit_type(const std::string& s);
std::optional<AccountKind> parse_account_kind(const std::string& s);
std::optional<ErrorCode> parse_error_code(const std::string& s);
std::optional<WarningCode> parse_warning_code(const std::string& s);

// 代码集合 <-> 逗号分隔字符串 ("MISSING_GO,NO_BOOKINGS")
std::string join_codes(const ErrorSet& codes);
std::string join_codes(const WarningSet& codes);
// 未知代码被忽略, 返回 false
bool split_codes(const std::string& text, ErrorSet& out);
bool split_codes(const std::string& text, WarningSet& out);

// "HH:MM" <-> 距午夜分钟数, 允许 "24:00" (= 1440)
std::optional<int> parse_clock(const std::string& text);
std::string format_clock(int minutes);

} // namespace core

#endif // CORE_CODES_H
