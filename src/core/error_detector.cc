/**
 * @file error_detector.cc
 * @brief 错误与警告检测实现
 */

#include "core/error_detector.h"

#include <map>
#include <utility>

#include "config.h"

namespace core {

namespace {

bool has_overlapping_bookings(const std::vector<BookingEvent>& bookings) {
    std::map<std::pair<BookingCategory, int>, int> seen;
    for (const auto& b : bookings) {
        if (++seen[{b.category, b.effective_time()}] > 1) return true;
    }
    return false;
}

} // namespace

DayIssues detect_issues(const DailyResult& result,
                        const std::vector<BookingEvent>& bookings,
                        const ScheduleConfig& schedule) {
    DayIssues issues;
    if (result.kind != DayKind::Normal) return issues;

    const int grace = Config::Policy::WINDOW_GRACE_MINUTES;
    const Tolerance& tol = schedule.tolerance;

    if (result.first_come) {
        int come = *result.first_come;
        if (schedule.come_from && come < *schedule.come_from - grace) {
            issues.errors.insert(ErrorCode::CameBeforeAllowed);
        }
        const std::optional<int>& latest = schedule.come_to ? schedule.come_to : schedule.come_from;
        if (latest && come > *latest + tol.come_plus) {
            issues.warnings.insert(WarningCode::LateArrival);
        }
    }

    if (result.last_go) {
        int go = *result.last_go;
        const std::optional<int>& latest = schedule.go_to ? schedule.go_to : schedule.go_from;
        if (latest && go > *latest + grace) {
            issues.errors.insert(ErrorCode::LeftAfterAllowed);
        }
        const std::optional<int>& earliest = schedule.go_from ? schedule.go_from : schedule.go_to;
        if (earliest && go < *earliest - tol.go_minus) {
            issues.warnings.insert(WarningCode::EarlyDeparture);
        }
    }

    if (schedule.kind == PlanKind::Flextime && schedule.core_start && schedule.core_end) {
        bool covered = result.first_come && result.last_go &&
                       *result.first_come <= *schedule.core_start &&
                       *result.last_go >= *schedule.core_end;
        if (!covered) {
            issues.errors.insert(ErrorCode::MissedCoreTime);
        }
    }

    if (has_overlapping_bookings(bookings)) {
        issues.errors.insert(ErrorCode::OverlappingBookings);
    }

    for (const auto& p : result.pairs) {
        if (p.duration() < 0) {
            issues.errors.insert(ErrorCode::NegativeDuration);
            break;
        }
    }

    if (result.gross_minutes > Config::Policy::LONG_WORK_DAY_MINUTES) {
        issues.warnings.insert(WarningCode::LongWorkDay);
    }

    return issues;
}

void merge_issues(DailyResult& result, const DayIssues& issues) {
    result.errors.insert(issues.errors.begin(), issues.errors.end());
    result.warnings.insert(issues.warnings.begin(), issues.warnings.end());
}

DailyResult annotate_day(DailyResult result,
                         const std::vector<BookingEvent>& bookings,
                         const ScheduleConfig& schedule) {
    merge_issues(result, detect_issues(result, bookings, schedule));
    return result;
}

} // namespace core
