/**
 * @file vacation.h
 * @brief 年假计算 - 按在职月数折算、按周工时折算、叠加特殊奖励天数, 最后取整到半天
 */

#ifndef CORE_VACATION_H
#define CORE_VACATION_H

#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "core/decimal.h"

namespace core {

// 假期年度: 自然年 (1/1 - 12/31) 或入职周年
enum class VacationBasis { CalendarYear, EntryDate };

enum class SpecialRuleKind { Age, Tenure, Disability };

struct VacationSpecialRule {
    SpecialRuleKind kind = SpecialRuleKind::Age;
    int threshold = 0;              // 年龄/工龄 (年), disability 忽略
    Decimal bonus_days;
};

struct VacationCalcInput {
    boost::gregorian::date birth_date;
    boost::gregorian::date entry_date;
    std::optional<boost::gregorian::date> exit_date;
    Decimal weekly_hours;
    bool has_disability = false;

    Decimal base_days;
    Decimal standard_weekly_hours;
    VacationBasis basis = VacationBasis::CalendarYear;
    std::vector<VacationSpecialRule> special_rules;

    int year = 0;
    boost::gregorian::date reference_date;   // 计算年龄/工龄的参考日
};

struct VacationCalcOutput {
    Decimal base_entitlement;
    Decimal prorated_entitlement;
    Decimal part_time_entitlement;

    Decimal age_bonus;
    Decimal tenure_bonus;
    Decimal disability_bonus;

    Decimal total_entitlement;      // 取整到 0.5 天

    int months_employed = 0;
    int age_at_reference = 0;
    int tenure_years = 0;
};

VacationCalcOutput calculate_vacation(const VacationCalcInput& input);

// 参考日的周岁, 不小于 0
int calculate_age(const boost::gregorian::date& birth, const boost::gregorian::date& reference);

// 参考日的整年工龄, 参考日早于入职日时为 0
int calculate_tenure(const boost::gregorian::date& entry, const boost::gregorian::date& reference);

/**
 * @brief 指定年度内的在职月数
 * @details 不足一个月按整月计, 最多 12。入职周年口径下年度从 year 年的入职月日开始。
 */
int months_employed(const boost::gregorian::date& entry,
                    const std::optional<boost::gregorian::date>& exit,
                    int year,
                    VacationBasis basis);

// 结转天数: available <= 0 时为 0, 设置了上限时不超过上限
Decimal calculate_carryover(const Decimal& available, const std::optional<Decimal>& max_carryover);

// 日期加 n 个月, 日超出目标月天数时取月末
boost::gregorian::date add_months(const boost::gregorian::date& d, int months);

const char* to_string(VacationBasis v);
const char* to_string(SpecialRuleKind v);
std::optional<VacationBasis> parse_vacation_basis(const std::string& s);
std::optional<SpecialRuleKind> parse_special_rule_kind(const std::string& s);

} // namespace core

#endif // CORE_VACATION_H
