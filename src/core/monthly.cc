/**
 * @file monthly.cc
 * @brief 月度汇总实现
 */

#include "core/monthly.h"

#include <utility>

namespace core {

namespace {

void apply_credit_type(MonthlyResult& r, const MonthlyEvaluation& rules) {
    switch (rules.credit_type) {
        case CreditType::NoEvaluation:
            r.flextime_credited = r.flextime_change;
            r.flextime_end = r.flextime_raw;
            return;

        case CreditType::CompleteCarryover:
        case CreditType::AfterThreshold: {
            int credited = r.flextime_change;
            if (rules.credit_type == CreditType::AfterThreshold) {
                int threshold = rules.flextime_threshold.value_or(0);
                if (credited > threshold) {
                    credited -= threshold;
                    r.flextime_forfeited = threshold;
                } else if (credited > 0) {
                    r.flextime_forfeited = credited;
                    credited = 0;
                    r.warnings.insert(WarningCode::BelowThreshold);
                }
                // 欠班不受阈值影响, 全部扣除
            }

            if (rules.max_flextime_per_month && credited > *rules.max_flextime_per_month) {
                r.flextime_forfeited += credited - *rules.max_flextime_per_month;
                credited = *rules.max_flextime_per_month;
                r.warnings.insert(WarningCode::MonthlyCapReached);
            }

            r.flextime_credited = credited;
            int uncapped = r.flextime_start + credited;
            int forfeited = 0;
            r.flextime_end = apply_flextime_caps(uncapped, rules.flextime_cap_positive,
                                                 rules.flextime_cap_negative, forfeited);
            r.flextime_forfeited += forfeited;
            if (r.flextime_end != uncapped) {
                r.warnings.insert(WarningCode::FlextimeCapped);
            }
            return;
        }

        case CreditType::NoCarryover:
            r.flextime_credited = 0;
            r.flextime_end = 0;
            r.flextime_forfeited = r.flextime_change;
            r.warnings.insert(WarningCode::NoCarryover);
            return;
    }
}

} // namespace

int apply_flextime_caps(int flextime,
                        const std::optional<int>& cap_positive,
                        const std::optional<int>& cap_negative,
                        int& forfeited) {
    forfeited = 0;
    if (cap_positive && flextime > *cap_positive) {
        forfeited = flextime - *cap_positive;
        flextime = *cap_positive;
    }
    if (cap_negative && flextime < -*cap_negative) {
        flextime = -*cap_negative;
    }
    return flextime;
}

int annual_carryover(int balance, const std::optional<int>& annual_floor) {
    if (annual_floor && balance < -*annual_floor) {
        return -*annual_floor;
    }
    return balance;
}

MonthlyResult aggregate_month(int year, int month,
                              const std::vector<DailyResult>& days,
                              int previous_carryover,
                              const std::optional<MonthlyEvaluation>& rules) {
    MonthlyResult r;
    r.year = year;
    r.month = month;
    r.flextime_start = previous_carryover;

    for (const auto& d : days) {
        r.gross_minutes += d.gross_minutes;
        r.net_minutes += d.net_minutes;
        r.target_minutes += d.target_minutes;
        r.overtime_minutes += d.overtime_minutes;
        r.undertime_minutes += d.undertime_minutes;
        r.break_minutes += d.break_minutes;

        // 有计入时间的日子都算出勤日, 含带薪缺勤和节假日抵扣
        if (d.gross_minutes > 0 || d.net_minutes > 0) {
            ++r.work_days;
        }
        if (d.has_error()) {
            ++r.error_days;
        }
        if (d.kind == DayKind::Absence && d.absence_kind) {
            switch (*d.absence_kind) {
                case AbsenceKind::Vacation: r.vacation_days += d.absence_fraction; break;
                case AbsenceKind::Sick:     r.sick_days += d.absence_fraction; break;
                case AbsenceKind::Other:    r.other_absence_days += d.absence_fraction; break;
            }
        }
    }

    r.flextime_change = r.overtime_minutes - r.undertime_minutes;
    r.flextime_raw = r.flextime_start + r.flextime_change;

    apply_credit_type(r, rules.value_or(MonthlyEvaluation{}));
    return r;
}

// ============================================
// MonthSheet
// ============================================

MonthSheet::MonthSheet(int year, int month,
                       int previous_carryover,
                       std::optional<MonthlyEvaluation> rules)
    : previous_carryover_(previous_carryover)
    , rules_(std::move(rules)) {
    result_.year = year;
    result_.month = month;
    recompute();
}

bool MonthSheet::contains(const boost::gregorian::date& date) const {
    return !date.is_special() &&
           date.year() == result_.year &&
           date.month() == result_.month;
}

TransitionStatus MonthSheet::upsert_day(const boost::gregorian::date& date, const DailyResult& result) {
    if (!contains(date)) return TransitionStatus::OutOfRange;
    if (result_.is_closed) return TransitionStatus::AlreadyClosed;

    days_[date] = result;
    recompute();
    return TransitionStatus::Ok;
}

TransitionStatus MonthSheet::close(const std::string& actor, std::time_t at) {
    if (result_.is_closed) return TransitionStatus::AlreadyClosed;

    recompute();
    result_.is_closed = true;
    result_.closed_by = actor;
    result_.closed_at = at;
    return TransitionStatus::Ok;
}

TransitionStatus MonthSheet::reopen(const std::string& actor, std::time_t at) {
    if (!result_.is_closed) return TransitionStatus::NotClosed;

    result_.is_closed = false;
    result_.reopened_by = actor;
    result_.reopened_at = at;
    return TransitionStatus::Ok;
}

void MonthSheet::recompute() {
    std::vector<DailyResult> days;
    days.reserve(days_.size());
    for (const auto& kv : days_) {
        days.push_back(kv.second);
    }

    MonthlyResult fresh = aggregate_month(result_.year, result_.month, days,
                                          previous_carryover_, rules_);
    fresh.is_closed = result_.is_closed;
    fresh.closed_by = result_.closed_by;
    fresh.closed_at = result_.closed_at;
    fresh.reopened_by = result_.reopened_by;
    fresh.reopened_at = result_.reopened_at;
    result_ = std::move(fresh);
}

} // namespace core
