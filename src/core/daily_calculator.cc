/**
 * @file daily_calculator.cc
 * @brief 日计算实现
 */

#include "core/daily_calculator.h"

#include <algorithm>
#include <utility>

#include "config.h"
#include "core/breaks.h"
#include "core/error_detector.h"
#include "core/interval.h"
#include "core/normalizer.h"
#include "core/pairing.h"
#include "core/shift_detector.h"
#include "core/surcharge.h"

namespace core {

namespace {

DailyResult base_result(const DayInput& input) {
    DailyResult result;
    result.booking_count = static_cast<int>(input.bookings.size());
    if (input.schedule) {
        result.plan_code = input.schedule->code;
        result.target_minutes = input.schedule->target_minutes;
    }
    return result;
}

// 缺勤是否压过节假日
bool absence_wins(const DayInput& input) {
    if (!input.absence) return false;
    if (!input.is_holiday) return true;
    int holiday_priority = input.schedule ? input.schedule->holiday_priority : 0;
    return input.absence->priority > holiday_priority;
}

DailyResult absence_day(const DayInput& input, const AbsenceFact& absence) {
    DailyResult result = base_result(input);
    result.kind = DayKind::Absence;
    result.absence_kind = absence.kind;
    result.absence_fraction = absence.duration_fraction;

    int credit = absence_credit_minutes(result.target_minutes, absence);
    result.gross_minutes = credit;
    result.net_minutes = credit;

    if (!input.bookings.empty()) {
        result.warnings.insert(WarningCode::BookingsOnAbsenceDay);
    }
    if (input.is_holiday) {
        result.warnings.insert(WarningCode::AbsenceOnHoliday);
    }
    return result;
}

DailyResult holiday_day(const DayInput& input) {
    DailyResult result = base_result(input);
    result.kind = DayKind::Holiday;
    result.warnings.insert(WarningCode::Holiday);
    if (input.absence) {
        result.warnings.insert(WarningCode::AbsenceOnHoliday);
    }
    if (!input.schedule) return result;

    int category = input.holiday_category.value_or(Config::Default::HOLIDAY_CATEGORY);
    int credit = holiday_credit_for(*input.schedule, category);
    result.gross_minutes = credit;
    result.net_minutes = credit;
    result.undertime_minutes = std::max(result.target_minutes - credit, 0);
    return result;
}

DailyResult off_day(const DayInput& input) {
    DailyResult result = base_result(input);
    result.kind = DayKind::OffDay;
    result.warnings.insert(WarningCode::OffDay);
    if (!input.bookings.empty()) {
        result.warnings.insert(WarningCode::BookingsOnOffDay);
    }
    return result;
}

std::optional<DailyResult> no_booking_day(const DayInput& input) {
    const ScheduleConfig& schedule = *input.schedule;
    DailyResult result = base_result(input);
    result.kind = DayKind::NoBookings;

    switch (schedule.no_booking_policy) {
        case NoBookingPolicy::Skip:
            return std::nullopt;
        case NoBookingPolicy::CreditTarget:
            result.gross_minutes = result.target_minutes;
            result.net_minutes = result.target_minutes;
            result.warnings.insert(WarningCode::NoBookingsCredited);
            return result;
        case NoBookingPolicy::CreditZero:
            result.undertime_minutes = result.target_minutes;
            result.warnings.insert(WarningCode::NoBookingsDeducted);
            return result;
        case NoBookingPolicy::UseAbsence:
            if (schedule.no_booking_absence) {
                DailyResult absence = absence_day(input, *schedule.no_booking_absence);
                absence.warnings.insert(WarningCode::NoBookingsAbsenceApplied);
                return absence;
            }
            break;
        case NoBookingPolicy::Error:
            break;
    }

    result.undertime_minutes = result.target_minutes;
    result.errors.insert(ErrorCode::NoBookings);
    return result;
}

DailyResult normal_day(const DayInput& input) {
    DailyResult result = base_result(input);
    result.kind = DayKind::Normal;

    // 1. 班次识别
    ShiftDetectionResult shift = detect_shift(*input.schedule,
                                              find_first_come(input.bookings),
                                              find_last_go(input.bookings),
                                              input.plan_lookup);
    const ScheduleConfig& plan = *shift.matched_plan;
    if (shift.has_error) {
        result.errors.insert(ErrorCode::NoMatchingShift);
    }
    result.plan_code = plan.code;
    result.target_minutes = plan.target_minutes;

    // 2. 配对
    PairingResult paired = pair_bookings(input.bookings);
    result.errors.insert(paired.errors.begin(), paired.errors.end());
    std::vector<TimePair> breaks = pairs_of_kind(paired.pairs, PairKind::Break);

    // 3. 容差 -> 取整 -> 窗口截断
    NormalizedPairs work = normalize_work_pairs(pairs_of_kind(paired.pairs, PairKind::Work), plan);
    if (work.capped_minutes > 0) {
        result.warnings.insert(WarningCode::WindowCapped);
    }
    result.first_come = work.first_start ? work.first_start : find_first_come(input.bookings);
    result.last_go = work.last_end ? work.last_end : find_last_go(input.bookings);

    result.pairs = work.pairs;
    result.pairs.insert(result.pairs.end(), breaks.begin(), breaks.end());

    // 4. 毛工时与休息
    result.gross_minutes = total_duration(work.pairs);
    BreakDeduction deduction = calculate_break_deduction(work.pairs, breaks, plan.breaks);
    result.break_minutes = deduction.deducted_minutes;
    result.paid_break_minutes = deduction.paid_minutes;
    result.warnings.insert(deduction.warnings.begin(), deduction.warnings.end());

    // 5. 净工时及上下限
    int net_capped = 0;
    result.net_minutes = apply_net_cap(calculate_net_time(result.gross_minutes, result.break_minutes),
                                       plan.max_net_work_time, net_capped);
    if (net_capped > 0) {
        result.warnings.insert(WarningCode::NetTimeCapped);
    }
    result.capped_minutes = work.capped_minutes + net_capped;

    if (plan.min_net_work_time && result.net_minutes < *plan.min_net_work_time) {
        result.errors.insert(ErrorCode::BelowMinWorkTime);
    }

    // 6. 加班/欠班
    result.overtime_minutes = std::max(result.net_minutes - result.target_minutes, 0);
    result.undertime_minutes = std::max(result.target_minutes - result.net_minutes, 0);

    // 7. 附加时间
    result.surcharges = calculate_surcharges(work.pairs, plan.surcharges,
                                             input.is_holiday, input.holiday_category);

    if (input.is_holiday) {
        result.warnings.insert(WarningCode::Holiday);
        if (input.absence) {
            result.warnings.insert(WarningCode::AbsenceOnHoliday);
        }
    }

    return annotate_day(std::move(result), input.bookings, plan);
}

} // namespace

int holiday_credit_for(const ScheduleConfig& schedule, int category) {
    auto it = schedule.holiday_credit.find(category);
    if (it != schedule.holiday_credit.end()) {
        return it->second;
    }
    switch (category) {
        case 1:
            return schedule.target_minutes;
        case 2:
            return schedule.target_minutes / Config::Default::HALF_HOLIDAY_DIVISOR;
        default:
            return 0;
    }
}

int absence_credit_minutes(int target_minutes, const AbsenceFact& absence) {
    if (!absence.credits_hours) return 0;
    Decimal credit = Decimal::from_int(target_minutes) * absence.portion * absence.duration_fraction;
    return static_cast<int>(credit.round_to_int());
}

std::optional<DailyResult> calculate_day(const DayInput& input) {
    if (absence_wins(input)) {
        return absence_day(input, *input.absence);
    }
    if (input.is_holiday && (input.bookings.empty() || !input.schedule)) {
        return holiday_day(input);
    }
    if (!input.schedule) {
        return off_day(input);
    }
    if (input.bookings.empty()) {
        return no_booking_day(input);
    }
    return normal_day(input);
}

} // namespace core
