/**
 * @file validation.h
 * @brief 配置校验 - 日计划/休息规则/班次识别窗口
 * @details 返回错误描述列表, 为空表示有效。无效配置必须拒绝保存, 不做任何自动修正。
 */

#ifndef CORE_VALIDATION_H
#define CORE_VALIDATION_H

#include <string>
#include <vector>

#include "core/time_types.h"

namespace core {

std::vector<std::string> validate_break_rule(const BreakRule& rule);

std::vector<std::string> validate_rounding_rule(const RoundingRule& rule, const std::string& name);

// 识别窗口在 [0, 1440] 内, from <= to, 两端同时设置或都不设置; 备选计划最多 6 个
std::vector<std::string> validate_shift_detection(const ScheduleConfig& schedule);

// 完整校验, 包含休息规则、附加时间规则和班次识别
std::vector<std::string> validate_schedule(const ScheduleConfig& schedule);

} // namespace core

#endif // CORE_VALIDATION_H
