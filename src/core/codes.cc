/**
 * @file codes.cc
 * @brief 枚举字符串编码实现
 * @details to_string 使用不带 default 的 switch, 新增枚举值时编译器会提示遗漏。
 */

#include "core/codes.h"

#include <cstdio>
#include <sstream>

#include "config.h"

namespace core {

namespace {

template <typename E, size_t N>
std::optional<E> parse_from(const std::string& s, const E (&all)[N]) {
    for (E v : all) {
        if (s == to_string(v)) return v;
    }
    return std::nullopt;
}

const PlanKind ALL_PLAN_KINDS[] = {PlanKind::Fixed, PlanKind::Flextime};

const BookingCategory ALL_CATEGORIES[] = {
    BookingCategory::Come, BookingCategory::Go,
    BookingCategory::BreakStart, BookingCategory::BreakEnd};

const RoundingMode ALL_ROUNDING[] = {
    RoundingMode::None, RoundingMode::Up, RoundingMode::Down, RoundingMode::Nearest};

const BreakKind ALL_BREAK_KINDS[] = {BreakKind::Fixed, BreakKind::Variable, BreakKind::Minimum};

const NoBookingPolicy ALL_POLICIES[] = {
    NoBookingPolicy::Error, NoBookingPolicy::CreditTarget, NoBookingPolicy::CreditZero,
    NoBookingPolicy::Skip, NoBookingPolicy::UseAbsence};

const DayKind ALL_DAY_KINDS[] = {
    DayKind::Normal, DayKind::Absence, DayKind::Holiday, DayKind::OffDay, DayKind::NoBookings};

const AbsenceKind ALL_ABSENCE_KINDS[] = {AbsenceKind::Vacation, AbsenceKind::Sick, AbsenceKind::Other};

const CreditType ALL_CREDIT_TYPES[] = {
    CreditType::NoEvaluation, CreditType::CompleteCarryover,
    CreditType::AfterThreshold, CreditType::NoCarryover};

const AccountKind ALL_ACCOUNT_KINDS[] = {
    AccountKind::Flextime, AccountKind::Vacation, AccountKind::Overtime, AccountKind::Surcharge};

const ErrorCode ALL_ERRORS[] = {
    ErrorCode::MissingCome, ErrorCode::MissingGo, ErrorCode::MissingBreakStart,
    ErrorCode::MissingBreakEnd, ErrorCode::CameBeforeAllowed, ErrorCode::LeftAfterAllowed,
    ErrorCode::MissedCoreTime, ErrorCode::OverlappingBookings, ErrorCode::NegativeDuration,
    ErrorCode::NoBookings, ErrorCode::BelowMinWorkTime, ErrorCode::NoMatchingShift};

const WarningCode ALL_WARNINGS[] = {
    WarningCode::LateArrival, WarningCode::EarlyDeparture, WarningCode::LongWorkDay,
    WarningCode::NetTimeCapped, WarningCode::ManualBreak, WarningCode::AutoBreakApplied,
    WarningCode::NoBreakRecorded, WarningCode::WindowCapped, WarningCode::OffDay,
    WarningCode::BookingsOnOffDay, WarningCode::Holiday, WarningCode::AbsenceOnHoliday,
    WarningCode::BookingsOnAbsenceDay, WarningCode::NoBookingsCredited,
    WarningCode::NoBookingsDeducted, WarningCode::NoBookingsAbsenceApplied,
    WarningCode::MonthlyCapReached, WarningCode::FlextimeCapped,
    WarningCode::BelowThreshold, WarningCode::NoCarryover};

template <typename Set>
std::string join(const Set& codes) {
    std::string out;
    for (auto code : codes) {
        if (!out.empty()) out += ",";
        out += to_string(code);
    }
    return out;
}

template <typename Set, typename Parser>
bool split(const std::string& text, Set& out, Parser parse) {
    bool all_known = true;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        auto code = parse(item);
        if (code) {
            out.insert(*code);
        } else {
            all_known = false;
        }
    }
    return all_known;
}

} // namespace

const char* to_string(PlanKind v) {
    switch (v) {
        case PlanKind::Fixed: return "fixed";
        case PlanKind::Flextime: return "flextime";
    }
    return "";
}

const char* to_string(BookingCategory v) {
    switch (v) {
        case BookingCategory::Come: return "come";
        case BookingCategory::Go: return "go";
        case BookingCategory::BreakStart: return "break_start";
        case BookingCategory::BreakEnd: return "break_end";
    }
    return "";
}

const char* to_string(PairKind v) {
    switch (v) {
        case PairKind::Work: return "work";
        case PairKind::Break: return "break";
    }
    return "";
}

const char* to_string(RoundingMode v) {
    switch (v) {
        case RoundingMode::None: return "none";
        case RoundingMode::Up: return "up";
        case RoundingMode::Down: return "down";
        case RoundingMode::Nearest: return "nearest";
    }
    return "";
}

const char* to_string(BreakKind v) {
    switch (v) {
        case BreakKind::Fixed: return "fixed";
        case BreakKind::Variable: return "variable";
        case BreakKind::Minimum: return "minimum";
    }
    return "";
}

const char* to_string(NoBookingPolicy v) {
    switch (v) {
        case NoBookingPolicy::Error: return "error";
        case NoBookingPolicy::CreditTarget: return "credit_target";
        case NoBookingPolicy::CreditZero: return "credit_zero";
        case NoBookingPolicy::Skip: return "skip";
        case NoBookingPolicy::UseAbsence: return "use_absence";
    }
    return "";
}

const char* to_string(DayKind v) {
    switch (v) {
        case DayKind::Normal: return "normal";
        case DayKind::Absence: return "absence";
        case DayKind::Holiday: return "holiday";
        case DayKind::OffDay: return "off_day";
        case DayKind::NoBookings: return "no_bookings";
    }
    return "";
}

const char* to_string(AbsenceKind v) {
    switch (v) {
        case AbsenceKind::Vacation: return "vacation";
        case AbsenceKind::Sick: return "sick";
        case AbsenceKind::Other: return "other";
    }
    return "";
}

const char* to_string(ShiftMatch v) {
    switch (v) {
        case ShiftMatch::None: return "none";
        case ShiftMatch::Arrival: return "arrival";
        case ShiftMatch::Departure: return "departure";
        case ShiftMatch::Both: return "both";
    }
    return "";
}

const char* to_string(CreditType v) {
    switch (v) {
        case CreditType::NoEvaluation: return "no_evaluation";
        case CreditType::CompleteCarryover: return "complete_carryover";
        case CreditType::AfterThreshold: return "after_threshold";
        case CreditType::NoCarryover: return "no_carryover";
    }
    return "";
}

const char* to_string(AccountKind v) {
    switch (v) {
        case AccountKind::Flextime: return "flextime";
        case AccountKind::Vacation: return "vacation";
        case AccountKind::Overtime: return "overtime";
        case AccountKind::Surcharge: return "surcharge";
    }
    return "";
}

const char* to_string(TransitionStatus v) {
    switch (v) {
        case TransitionStatus::Ok: return "ok";
        case TransitionStatus::AlreadyClosed: return "already_closed";
        case TransitionStatus::NotClosed: return "not_closed";
        case TransitionStatus::OutOfRange: return "out_of_range";
    }
    return "";
}

const char* to_string(ErrorCode v) {
    switch (v) {
        case ErrorCode::MissingCome: return "MISSING_COME";
        case ErrorCode::MissingGo: return "MISSING_GO";
        case ErrorCode::MissingBreakStart: return "MISSING_BREAK_START";
        case ErrorCode::MissingBreakEnd: return "MISSING_BREAK_END";
        case ErrorCode::CameBeforeAllowed: return "CAME_BEFORE_ALLOWED";
        case ErrorCode::LeftAfterAllowed: return "LEFT_AFTER_ALLOWED";
        case ErrorCode::MissedCoreTime: return "MISSED_CORE_TIME";
        case ErrorCode::OverlappingBookings: return "OVERLAPPING_BOOKINGS";
        case ErrorCode::NegativeDuration: return "NEGATIVE_DURATION";
        case ErrorCode::NoBookings: return "NO_BOOKINGS";
        case ErrorCode::BelowMinWorkTime: return "BELOW_MIN_WORK_TIME";
        case ErrorCode::NoMatchingShift: return "NO_MATCHING_SHIFT";
    }
    return "";
}

const char* to_string(WarningCode v) {
    switch (v) {
        case WarningCode::LateArrival: return "LATE_ARRIVAL";
        case WarningCode::EarlyDeparture: return "EARLY_DEPARTURE";
        case WarningCode::LongWorkDay: return "LONG_WORK_DAY";
        case WarningCode::NetTimeCapped: return "NET_TIME_CAPPED";
        case WarningCode::ManualBreak: return "MANUAL_BREAK";
        case WarningCode::AutoBreakApplied: return "AUTO_BREAK_APPLIED";
        case WarningCode::NoBreakRecorded: return "NO_BREAK_RECORDED";
        case WarningCode::WindowCapped: return "WINDOW_CAPPED";
        case WarningCode::OffDay: return "OFF_DAY";
        case WarningCode::BookingsOnOffDay: return "BOOKINGS_ON_OFF_DAY";
        case WarningCode::Holiday: return "HOLIDAY";
        case WarningCode::AbsenceOnHoliday: return "ABSENCE_ON_HOLIDAY";
        case WarningCode::BookingsOnAbsenceDay: return "BOOKINGS_ON_ABSENCE_DAY";
        case WarningCode::NoBookingsCredited: return "NO_BOOKINGS_CREDITED";
        case WarningCode::NoBookingsDeducted: return "NO_BOOKINGS_DEDUCTED";
        case WarningCode::NoBookingsAbsenceApplied: return "NO_BOOKINGS_ABSENCE_APPLIED";
        case WarningCode::MonthlyCapReached: return "MONTHLY_CAP_REACHED";
        case WarningCode::FlextimeCapped: return "FLEXTIME_CAPPED";
        case WarningCode::BelowThreshold: return "BELOW_THRESHOLD";
        case WarningCode::NoCarryover: return "NO_CARRYOVER";
    }
    return "";
}

std::optional<PlanKind> parse_plan_kind(const std::string& s) {
    return parse_from(s, ALL_PLAN_KINDS);
}

std::optional<BookingCategory> parse_booking_category(const std::string& s) {
    return parse_from(s, ALL_CATEGORIES);
}

std::optional<RoundingMode> parse_rounding_mode(const std::string& s) {
    return parse_from(s, ALL_ROUNDING);
}

std::optional<BreakKind> parse_break_kind(const std::string& s) {
    return parse_from(s, ALL_BREAK_KINDS);
}

std::optional<NoBookingPolicy> parse_no_booking_policy(const std::string& s) {
    return parse_from(s, ALL_POLICIES);
}

std::optional<DayKind> parse_day_kind(const std::string& s) {
    return parse_from(s, ALL_DAY_KINDS);
}

std::optional<AbsenceKind> parse_absence_kind(const std::string& s) {
    return parse_from(s, ALL_ABSENCE_KINDS);
}

std::optional<CreditType> parse_credit_type(const std::string& s) {
    return parse_from(s, ALL_CREDIT_TYPES);
}

std::optional<AccountKind> parse_account_kind(const std::string& s) {
    return parse_from(s, ALL_ACCOUNT_KINDS);
}

std::optional<ErrorCode> parse_error_code(const std::string& s) {
    return parse_from(s, ALL_ERRORS);
}

std::optional<WarningCode> parse_warning_code(const std::string& s) {
    return parse_from(s, ALL_WARNINGS);
}

std::string join_codes(const ErrorSet& codes) {
    return join(codes);
}

std::string join_codes(const WarningSet& codes) {
    return join(codes);
}

bool split_codes(const std::string& text, ErrorSet& out) {
    return split(text, out, parse_error_code);
}

bool split_codes(const std::string& text, WarningSet& out) {
    return split(text, out, parse_warning_code);
}

std::optional<int> parse_clock(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 3 != text.size()) return std::nullopt;

    int hours = 0;
    for (size_t i = 0; i < colon; ++i) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
        hours = hours * 10 + (text[i] - '0');
        if (hours > 24) return std::nullopt;
    }
    if (text[colon + 1] < '0' || text[colon + 1] > '5' ||
        text[colon + 2] < '0' || text[colon + 2] > '9') {
        return std::nullopt;
    }
    int minutes = (text[colon + 1] - '0') * 10 + (text[colon + 2] - '0');

    int total = hours * 60 + minutes;
    if (total > Config::Time::DAY_END) return std::nullopt;
    return total;
}

std::string format_clock(int minutes) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

} // namespace core
