/**
 * @file daily_calculator.h
 * @brief 日计算 - 把一天的日计划、打卡、缺勤/节假日信息合成为 DailyResult
 * @details 纯函数, 不做 I/O。按以下顺序分派:
 *          1. 缺勤或节假日 (两者同时存在时按优先级, 高者生效)
 *          2. 未分配日计划 (休息日)
 *          3. 有日计划但没有打卡 (按 no_booking_policy 处理)
 *          4. 正常工作日: 班次识别 -> 配对 -> 容差/取整 -> 休息扣除 -> 净工时 -> 加/欠班 -> 附加时间 -> 错误检测
 */

#ifndef CORE_DAILY_CALCULATOR_H
#define CORE_DAILY_CALCULATOR_H

#include <optional>

#include "core/time_types.h"

namespace core {

/**
 * @brief 节假日计入分钟数
 * @details 优先使用日计划的 holiday_credit 表;
 *          未配置时类别 1 = 全部目标时间, 类别 2 = 目标时间的一半, 其它 = 0。
 */
int holiday_credit_for(const ScheduleConfig& schedule, int category);

// 缺勤计入分钟数: credits_hours 时为 round(target * portion * duration_fraction), 否则 0
int absence_credit_minutes(int target_minutes, const AbsenceFact& absence);

/**
 * @brief 计算一天
 * @return 计算结果; 无打卡策略为 skip 时返回 std::nullopt (该日不产生结果)
 */
std::optional<DailyResult> calculate_day(const DayInput& input);

} // namespace core

#endif // CORE_DAILY_CALCULATOR_H
