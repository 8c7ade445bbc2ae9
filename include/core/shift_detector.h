/**
 * @file shift_detector.h
 * @brief 班次识别 - 根据到达/离开时间在分配的日计划和最多 6 个备选计划中选出生效计划
 */

#ifndef CORE_SHIFT_DETECTOR_H
#define CORE_SHIFT_DETECTOR_H

#include <optional>
#include <string>

#include "core/time_types.h"

namespace core {

struct ShiftDetectionResult {
    const ScheduleConfig* matched_plan = nullptr;  // 指向 assigned 或 lookup 返回的计划
    bool is_original = true;
    ShiftMatch match = ShiftMatch::None;
    bool has_error = false;
    std::string message;
};

bool has_arrival_window(const ScheduleConfig& plan);
bool has_departure_window(const ScheduleConfig& plan);
bool has_shift_detection(const ScheduleConfig& plan);

/**
 * @brief 判断到达/离开时间是否命中计划的识别窗口 (闭区间)
 * @details 两个窗口都配置时必须同时命中 (Both), 否则只检查已配置的那个。
 */
ShiftMatch match_plan(const ScheduleConfig& plan,
                      const std::optional<int>& first_arrival,
                      const std::optional<int>& last_departure);

/**
 * @brief 选择生效日计划
 * @details 未配置识别窗口或没有打卡时间时直接使用分配的计划;
 *          分配计划不命中时按配置顺序依次尝试备选计划 (最多 6 个), 返回第一个命中的;
 *          都不命中时返回分配的计划并置 has_error, 交给人工修正流程。
 */
ShiftDetectionResult detect_shift(const ScheduleConfig& assigned,
                                  const std::optional<int>& first_arrival,
                                  const std::optional<int>& last_departure,
                                  const PlanLookup& lookup);

} // namespace core

#endif // CORE_SHIFT_DETECTOR_H
