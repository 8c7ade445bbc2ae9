/**
 * @file vacation.cc
 * @brief 年假计算实现
 */

#include "core/vacation.h"

#include <algorithm>

#include "config.h"

namespace core {

namespace greg = boost::gregorian;

namespace {

// 周年日是否还没到 (只比较月日)
bool before_anniversary(const greg::date& d, const greg::date& reference) {
    if (reference.month() != d.month()) return reference.month() < d.month();
    return reference.day() < d.day();
}

// 指定年份的同月同日, 2/29 在平年取 2/28
greg::date same_day_in_year(const greg::date& d, int year) {
    int month = d.month();
    int last = greg::gregorian_calendar::end_of_month_day(year, month);
    return greg::date(year, month, std::min<int>(d.day(), last));
}

} // namespace

greg::date add_months(const greg::date& d, int months) {
    int total = d.year() * 12 + (d.month() - 1) + months;
    int year = total / 12;
    int month = total % 12 + 1;
    int last = greg::gregorian_calendar::end_of_month_day(year, month);
    return greg::date(year, month, std::min<int>(d.day(), last));
}

int calculate_age(const greg::date& birth, const greg::date& reference) {
    int years = reference.year() - birth.year();
    if (before_anniversary(birth, reference)) --years;
    return std::max(years, 0);
}

int calculate_tenure(const greg::date& entry, const greg::date& reference) {
    if (reference < entry) return 0;
    int years = reference.year() - entry.year();
    if (before_anniversary(entry, reference)) --years;
    return std::max(years, 0);
}

int months_employed(const greg::date& entry,
                    const std::optional<greg::date>& exit,
                    int year,
                    VacationBasis basis) {
    greg::date period_start(year, 1, 1);
    greg::date period_end(year, 12, 31);
    if (basis == VacationBasis::EntryDate) {
        period_start = same_day_in_year(entry, year);
        period_end = add_months(period_start, 12) - greg::days(1);
    }

    greg::date start = std::max(entry, period_start);
    greg::date end = period_end;
    if (exit && *exit < end) end = *exit;
    if (start > end) return 0;

    const int cap = Config::Policy::MAX_MONTHS_PER_YEAR;
    int months = 0;
    while (months < cap && add_months(start, months) <= end) {
        ++months;
    }
    return months;
}

VacationCalcOutput calculate_vacation(const VacationCalcInput& input) {
    VacationCalcOutput out;

    out.age_at_reference = calculate_age(input.birth_date, input.reference_date);
    out.tenure_years = calculate_tenure(input.entry_date, input.reference_date);
    out.months_employed = months_employed(input.entry_date, input.exit_date, input.year, input.basis);

    // 先乘后除, 每个结果只做一次除法舍入
    const Decimal months = Decimal::from_int(out.months_employed);
    const Decimal year_months = Decimal::from_int(Config::Policy::MAX_MONTHS_PER_YEAR);
    const Decimal employed_days = input.base_days * months;

    out.base_entitlement = input.base_days;
    out.prorated_entitlement = employed_days / year_months;

    if (input.standard_weekly_hours.is_positive()) {
        out.part_time_entitlement = employed_days * input.weekly_hours /
                                    (year_months * input.standard_weekly_hours);
    } else {
        out.part_time_entitlement = out.prorated_entitlement;
    }

    for (const auto& rule : input.special_rules) {
        switch (rule.kind) {
            case SpecialRuleKind::Age:
                if (out.age_at_reference >= rule.threshold) out.age_bonus += rule.bonus_days;
                break;
            case SpecialRuleKind::Tenure:
                if (out.tenure_years >= rule.threshold) out.tenure_bonus += rule.bonus_days;
                break;
            case SpecialRuleKind::Disability:
                if (input.has_disability) out.disability_bonus += rule.bonus_days;
                break;
        }
    }

    Decimal total = out.part_time_entitlement + out.age_bonus + out.tenure_bonus +
                    out.disability_bonus;
    out.total_entitlement = total.round_to_half();
    return out;
}

Decimal calculate_carryover(const Decimal& available, const std::optional<Decimal>& max_carryover) {
    if (!available.is_positive()) return Decimal();
    if (max_carryover && available > *max_carryover) return *max_carryover;
    return available;
}

const char* to_string(VacationBasis v) {
    switch (v) {
        case VacationBasis::CalendarYear: return "calendar_year";
        case VacationBasis::EntryDate:    return "entry_date";
    }
    return "";
}

const char* to_string(SpecialRuleKind v) {
    switch (v) {
        case SpecialRuleKind::Age:        return "age";
        case SpecialRuleKind::Tenure:     return "tenure";
        case SpecialRuleKind::Disability: return "disability";
    }
    return "";
}

std::optional<VacationBasis> parse_vacation_basis(const std::string& s) {
    for (auto v : {VacationBasis::CalendarYear, VacationBasis::EntryDate}) {
        if (s == to_string(v)) return v;
    }
    return std::nullopt;
}

std::optional<SpecialRuleKind> parse_special_rule_kind(const std::string& s) {
    for (auto v : {SpecialRuleKind::Age, SpecialRuleKind::Tenure, SpecialRuleKind::Disability}) {
        if (s == to_string(v)) return v;
    }
    return std::nullopt;
}

} // namespace core
