/**
 * @file validation.cc
 * @brief 配置校验实现
 */

#include "core/validation.h"

#include "config.h"
#include "core/surcharge.h"

namespace core {

namespace {

void append(std::vector<std::string>& out, const std::vector<std::string>& more,
            const std::string& prefix) {
    for (const auto& m : more) {
        out.push_back(prefix + m);
    }
}

bool in_day(int minutes) {
    return minutes >= 0 && minutes <= Config::Time::DAY_END;
}

// 可选窗口: 两端在一天之内, 同时设置时 from < to
void check_window(std::vector<std::string>& errors,
                  const std::optional<int>& from,
                  const std::optional<int>& to,
                  const std::string& name,
                  bool strict) {
    if (from && !in_day(*from)) {
        errors.push_back(name + " start must be between 0 and 1440");
    }
    if (to && !in_day(*to)) {
        errors.push_back(name + " end must be between 0 and 1440");
    }
    if (from && to && (strict ? *from >= *to : *from > *to)) {
        errors.push_back(name + " start must be before its end");
    }
}

} // namespace

std::vector<std::string> validate_break_rule(const BreakRule& rule) {
    std::vector<std::string> errors;

    if (rule.duration <= 0) {
        errors.push_back("duration must be positive");
    }

    switch (rule.kind) {
        case BreakKind::Fixed:
            if (!rule.start || !rule.end) {
                errors.push_back("fixed break requires start and end");
            } else {
                check_window(errors, rule.start, rule.end, "break window", true);
            }
            break;
        case BreakKind::Minimum:
            if (!rule.after_work_minutes) {
                errors.push_back("minimum break requires after_work_minutes");
            } else if (*rule.after_work_minutes < 0) {
                errors.push_back("after_work_minutes must not be negative");
            }
            break;
        case BreakKind::Variable:
            break;
    }
    return errors;
}

std::vector<std::string> validate_rounding_rule(const RoundingRule& rule, const std::string& name) {
    std::vector<std::string> errors;
    if (rule.mode != RoundingMode::None && rule.interval <= 0) {
        errors.push_back(name + " interval must be positive");
    } else if (rule.interval < 0) {
        errors.push_back(name + " interval must not be negative");
    }
    return errors;
}

std::vector<std::string> validate_shift_detection(const ScheduleConfig& schedule) {
    std::vector<std::string> errors;

    if (schedule.detect_arrive_from.has_value() != schedule.detect_arrive_to.has_value()) {
        errors.push_back("arrival detection window requires both bounds or neither");
    }
    if (schedule.detect_depart_from.has_value() != schedule.detect_depart_to.has_value()) {
        errors.push_back("departure detection window requires both bounds or neither");
    }
    check_window(errors, schedule.detect_arrive_from, schedule.detect_arrive_to,
                 "arrival detection window", false);
    check_window(errors, schedule.detect_depart_from, schedule.detect_depart_to,
                 "departure detection window", false);

    if (schedule.alternative_plans.size() >
        static_cast<size_t>(Config::Policy::MAX_ALTERNATIVE_PLANS)) {
        errors.push_back("at most 6 alternative plans are allowed");
    }
    for (const auto& code : schedule.alternative_plans) {
        if (code.empty()) {
            errors.push_back("alternative plan code must not be empty");
        } else if (code == schedule.code) {
            errors.push_back("plan must not list itself as alternative");
        }
    }
    return errors;
}

std::vector<std::string> validate_schedule(const ScheduleConfig& schedule) {
    std::vector<std::string> errors;

    if (schedule.code.empty()) {
        errors.push_back("plan code must not be empty");
    }
    if (schedule.target_minutes < 0 || schedule.target_minutes > Config::Time::MINUTES_PER_DAY) {
        errors.push_back("target_minutes must be between 0 and 1440");
    }

    check_window(errors, schedule.come_from, schedule.come_to, "come window", true);
    check_window(errors, schedule.go_from, schedule.go_to, "go window", true);
    check_window(errors, schedule.core_start, schedule.core_end, "core time", true);
    if (schedule.core_start.has_value() != schedule.core_end.has_value()) {
        errors.push_back("core time requires both bounds or neither");
    }

    const Tolerance& t = schedule.tolerance;
    if (t.come_plus < 0 || t.come_minus < 0 || t.go_plus < 0 || t.go_minus < 0) {
        errors.push_back("tolerance values must not be negative");
    }

    append(errors, validate_rounding_rule(schedule.rounding_come, "come rounding"), "");
    append(errors, validate_rounding_rule(schedule.rounding_go, "go rounding"), "");

    if (schedule.min_net_work_time && *schedule.min_net_work_time < 0) {
        errors.push_back("min_net_work_time must not be negative");
    }
    if (schedule.max_net_work_time && *schedule.max_net_work_time < 0) {
        errors.push_back("max_net_work_time must not be negative");
    }
    if (schedule.min_net_work_time && schedule.max_net_work_time &&
        *schedule.min_net_work_time > *schedule.max_net_work_time) {
        errors.push_back("min_net_work_time must not exceed max_net_work_time");
    }

    for (const auto& kv : schedule.holiday_credit) {
        if (kv.second < 0) {
            errors.push_back("holiday credit for category " + std::to_string(kv.first) +
                             " must not be negative");
        }
    }

    if (schedule.no_booking_policy == NoBookingPolicy::UseAbsence && schedule.no_booking_absence &&
        !schedule.no_booking_absence->duration_fraction.is_positive()) {
        errors.push_back("no-booking absence fraction must be positive");
    }

    for (size_t i = 0; i < schedule.breaks.size(); ++i) {
        append(errors, validate_break_rule(schedule.breaks[i]),
               "break " + std::to_string(i + 1) + ": ");
    }
    for (size_t i = 0; i < schedule.surcharges.size(); ++i) {
        append(errors, validate_surcharge_rule(schedule.surcharges[i]),
               "surcharge " + std::to_string(i + 1) + ": ");
    }
    append(errors, validate_shift_detection(schedule), "");

    return errors;
}

} // namespace core
