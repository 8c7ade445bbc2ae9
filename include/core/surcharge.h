/**
 * @file surcharge.h
 * @brief 附加时间计算 - 夜班/节假日时间窗口内的工作分钟计入独立账户
 * @details 窗口为 [time_from, time_to), 不允许跨午夜;
 *          "22:00-06:00" 这类窗口必须先用 split_overnight_surcharge 在 00:00 拆成两条规则。
 */

#ifndef CORE_SURCHARGE_H
#define CORE_SURCHARGE_H

#include <optional>
#include <string>
#include <vector>

#include "core/time_types.h"

namespace core {

// 返回错误描述, 为空表示有效
std::vector<std::string> validate_surcharge_rule(const SurchargeRule& rule);

// time_from >= time_to 时拆成 [time_from, 1440) 和 [0, time_to), 否则原样返回
std::vector<SurchargeRule> split_overnight_surcharge(const SurchargeRule& rule);

// 规则是否适用于当天 (工作日/节假日及节假日类别过滤)
bool surcharge_applies(const SurchargeRule& rule,
                       bool is_holiday,
                       const std::optional<int>& holiday_category);

/**
 * @brief 计算当天所有附加时间
 * @param work_pairs 工作配对 (休息配对会被忽略)
 * @return 每条适用且分钟数 > 0 的规则一条结果, 顺序与规则相同
 */
std::vector<SurchargeResult> calculate_surcharges(const std::vector<TimePair>& work_pairs,
                                                  const std::vector<SurchargeRule>& rules,
                                                  bool is_holiday,
                                                  const std::optional<int>& holiday_category);

int total_surcharge_minutes(const std::vector<SurchargeResult>& results);

} // namespace core

#endif // CORE_SURCHARGE_H
