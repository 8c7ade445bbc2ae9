/**
 * @file shift_detector.cc
 * @brief 班次识别实现
 */

#include "core/shift_detector.h"

#include <algorithm>

#include "config.h"
#include "core/interval.h"

namespace core {

bool has_arrival_window(const ScheduleConfig& plan) {
    return plan.detect_arrive_from && plan.detect_arrive_to;
}

bool has_departure_window(const ScheduleConfig& plan) {
    return plan.detect_depart_from && plan.detect_depart_to;
}

bool has_shift_detection(const ScheduleConfig& plan) {
    return has_arrival_window(plan) || has_departure_window(plan);
}

ShiftMatch match_plan(const ScheduleConfig& plan,
                      const std::optional<int>& first_arrival,
                      const std::optional<int>& last_departure) {
    bool check_arrival = has_arrival_window(plan);
    bool check_departure = has_departure_window(plan);

    bool arrival_hit = check_arrival && first_arrival &&
                       in_window(*first_arrival, plan.detect_arrive_from, plan.detect_arrive_to);
    bool departure_hit = check_departure && last_departure &&
                         in_window(*last_departure, plan.detect_depart_from, plan.detect_depart_to);

    if (check_arrival && check_departure) {
        return (arrival_hit && departure_hit) ? ShiftMatch::Both : ShiftMatch::None;
    }
    if (check_arrival) {
        return arrival_hit ? ShiftMatch::Arrival : ShiftMatch::None;
    }
    if (check_departure) {
        return departure_hit ? ShiftMatch::Departure : ShiftMatch::None;
    }
    return ShiftMatch::None;
}

ShiftDetectionResult detect_shift(const ScheduleConfig& assigned,
                                  const std::optional<int>& first_arrival,
                                  const std::optional<int>& last_departure,
                                  const PlanLookup& lookup) {
    ShiftDetectionResult result;
    result.matched_plan = &assigned;

    if (!has_shift_detection(assigned) || (!first_arrival && !last_departure)) {
        return result;
    }

    ShiftMatch match = match_plan(assigned, first_arrival, last_departure);
    if (match != ShiftMatch::None) {
        result.match = match;
        return result;
    }

    size_t count = std::min(assigned.alternative_plans.size(),
                            static_cast<size_t>(Config::Policy::MAX_ALTERNATIVE_PLANS));
    for (size_t i = 0; i < count && lookup; ++i) {
        const ScheduleConfig* alt = lookup(assigned.alternative_plans[i]);
        if (!alt) continue;

        match = match_plan(*alt, first_arrival, last_departure);
        if (match != ShiftMatch::None) {
            result.matched_plan = alt;
            result.is_original = false;
            result.match = match;
            return result;
        }
    }

    result.has_error = true;
    result.message = "no day plan matches the booking times of plan '" + assigned.code +
                     "' or its alternatives";
    return result;
}

} // namespace core
