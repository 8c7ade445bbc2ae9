/**
 * @file breaks.h
 * @brief 休息扣除 - 按日计划中的休息规则计算需要从毛工时扣除的分钟数
 */

#ifndef CORE_BREAKS_H
#define CORE_BREAKS_H

#include <optional>
#include <vector>

#include "core/time_types.h"

namespace core {

struct BreakDeduction {
    int deducted_minutes = 0;   // 从毛工时扣除 (不带薪)
    int paid_minutes = 0;       // 带薪休息, 只统计不扣除
    WarningSet warnings;
};

/**
 * @brief 固定休息: 工作区间与休息窗口的重叠分钟数 (扣掉已打卡休息在窗口内的部分), 最多 duration
 * @details 不论是否打了休息卡都会扣除; 窗口未完整配置时返回 0。
 */
int fixed_break_minutes(const std::vector<TimePair>& work_pairs,
                        const std::vector<TimePair>& break_pairs,
                        const BreakRule& rule);

/**
 * @brief 最低休息: 工作分钟数超过 after_work_minutes 后要求的休息时长
 * @details proportional 时只要求超出阈值的部分, 最多 duration。
 */
int minimum_break_minutes(int work_minutes, const BreakRule& rule);

/**
 * @brief 计算总休息扣除
 * @details 已打卡的休息总是扣除; 规则按配置顺序依次处理:
 *   - fixed: 加上 fixed_break_minutes
 *   - variable: 没有休息打卡且 auto_deduct 时加上 duration
 *   - minimum: 把目前累计的扣除量抬高到要求值 (只增不减)
 */
BreakDeduction calculate_break_deduction(const std::vector<TimePair>& work_pairs,
                                         const std::vector<TimePair>& break_pairs,
                                         const std::vector<BreakRule>& rules);

// 净工时 = 毛工时 - 休息, 不小于 0
int calculate_net_time(int gross_minutes, int break_minutes);

// 按上限截断净工时, 返回截断后的值; capped 返回被截掉的分钟数
int apply_net_cap(int net_minutes, const std::optional<int>& max_net, int& capped);

} // namespace core

#endif // CORE_BREAKS_H
