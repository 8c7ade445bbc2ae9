/**
 * @file surcharge.cc
 * @brief 附加时间计算实现
 */

#include "core/surcharge.h"

#include <algorithm>

#include "config.h"
#include "core/interval.h"

namespace core {

std::vector<std::string> validate_surcharge_rule(const SurchargeRule& rule) {
    std::vector<std::string> errors;
    const int day_end = Config::Time::DAY_END;

    if (rule.account.empty()) {
        errors.push_back("surcharge account must not be empty");
    }
    if (rule.time_from < 0 || rule.time_from >= day_end) {
        errors.push_back("time_from must be between 0 and 1439");
    }
    if (rule.time_to <= 0 || rule.time_to > day_end) {
        errors.push_back("time_to must be between 1 and 1440");
    }
    if (rule.time_from >= rule.time_to) {
        errors.push_back("time_from must be less than time_to (split overnight windows at 00:00)");
    }
    return errors;
}

std::vector<SurchargeRule> split_overnight_surcharge(const SurchargeRule& rule) {
    if (rule.time_from < rule.time_to) {
        return {rule};
    }

    SurchargeRule evening = rule;
    evening.time_to = Config::Time::DAY_END;

    SurchargeRule morning = rule;
    morning.time_from = 0;

    return {evening, morning};
}

bool surcharge_applies(const SurchargeRule& rule,
                       bool is_holiday,
                       const std::optional<int>& holiday_category) {
    if (!is_holiday) {
        return rule.applies_on_workday;
    }
    if (!rule.applies_on_holiday) {
        return false;
    }
    if (rule.holiday_categories.empty()) {
        return true;
    }
    if (!holiday_category) {
        return false;
    }
    return std::find(rule.holiday_categories.begin(), rule.holiday_categories.end(),
                     *holiday_category) != rule.holiday_categories.end();
}

std::vector<SurchargeResult> calculate_surcharges(const std::vector<TimePair>& work_pairs,
                                                  const std::vector<SurchargeRule>& rules,
                                                  bool is_holiday,
                                                  const std::optional<int>& holiday_category) {
    std::vector<SurchargeResult> results;

    for (const auto& rule : rules) {
        if (!surcharge_applies(rule, is_holiday, holiday_category)) continue;

        int minutes = 0;
        for (const auto& p : work_pairs) {
            if (p.kind != PairKind::Work) continue;
            minutes += overlap_minutes(p.start, p.end, rule.time_from, rule.time_to);
        }

        if (minutes > 0) {
            results.push_back({rule.account, minutes});
        }
    }

    return results;
}

int total_surcharge_minutes(const std::vector<SurchargeResult>& results) {
    int total = 0;
    for (const auto& r : results) {
        total += r.minutes;
    }
    return total;
}

} // namespace core
