/**
 * @file breaks.cc
 * @brief 休息扣除实现
 */

#include "core/breaks.h"

#include <algorithm>

#include "core/interval.h"

namespace core {

int fixed_break_minutes(const std::vector<TimePair>& work_pairs,
                        const std::vector<TimePair>& break_pairs,
                        const BreakRule& rule) {
    if (!rule.start || !rule.end || rule.duration <= 0) return 0;

    int worked = 0;
    for (const auto& p : work_pairs) {
        worked += overlap_minutes(p.start, p.end, *rule.start, *rule.end);
    }
    int booked = 0;
    for (const auto& p : break_pairs) {
        booked += overlap_minutes(p.start, p.end, *rule.start, *rule.end);
    }

    int minutes = std::max(worked - booked, 0);
    return std::min(minutes, rule.duration);
}

int minimum_break_minutes(int work_minutes, const BreakRule& rule) {
    if (!rule.after_work_minutes || rule.duration <= 0) return 0;
    if (work_minutes <= *rule.after_work_minutes) return 0;

    if (rule.proportional) {
        return std::min(work_minutes - *rule.after_work_minutes, rule.duration);
    }
    return rule.duration;
}

BreakDeduction calculate_break_deduction(const std::vector<TimePair>& work_pairs,
                                         const std::vector<TimePair>& break_pairs,
                                         const std::vector<BreakRule>& rules) {
    BreakDeduction result;

    int booked = total_duration(break_pairs);
    int gross = total_duration(work_pairs);
    result.deducted_minutes = booked;
    if (booked > 0 && !rules.empty()) {
        result.warnings.insert(WarningCode::ManualBreak);
    }

    for (const auto& rule : rules) {
        switch (rule.kind) {
            case BreakKind::Fixed: {
                int minutes = fixed_break_minutes(work_pairs, break_pairs, rule);
                if (rule.paid) {
                    result.paid_minutes += minutes;
                } else {
                    result.deducted_minutes += minutes;
                }
                break;
            }
            case BreakKind::Variable: {
                if (booked > 0) break;
                result.warnings.insert(WarningCode::NoBreakRecorded);
                if (!rule.auto_deduct || gross <= 0) break;
                if (rule.paid) {
                    result.paid_minutes += rule.duration;
                } else {
                    result.deducted_minutes += rule.duration;
                }
                result.warnings.insert(WarningCode::AutoBreakApplied);
                break;
            }
            case BreakKind::Minimum: {
                int required = minimum_break_minutes(gross, rule);
                if (required > result.deducted_minutes) {
                    result.deducted_minutes = required;
                    result.warnings.insert(WarningCode::AutoBreakApplied);
                    if (booked == 0) {
                        result.warnings.insert(WarningCode::NoBreakRecorded);
                    }
                }
                break;
            }
        }
    }

    return result;
}

int calculate_net_time(int gross_minutes, int break_minutes) {
    return std::max(gross_minutes - break_minutes, 0);
}

int apply_net_cap(int net_minutes, const std::optional<int>& max_net, int& capped) {
    capped = 0;
    if (!max_net || net_minutes <= *max_net) return net_minutes;
    capped = net_minutes - *max_net;
    return *max_net;
}

} // namespace core
