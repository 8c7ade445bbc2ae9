/**
 * @file error_detector.h
 * @brief 错误与警告检测 - 对已计算的工作日做事后检查
 * @details 只检查正常工作日 (DayKind::Normal), 缺勤/节假日/休息日直接跳过。
 *          错误进入人工修正流程, 警告不阻塞。
 */

#ifndef CORE_ERROR_DETECTOR_H
#define CORE_ERROR_DETECTOR_H

#include <vector>

#include "core/time_types.h"

namespace core {

struct DayIssues {
    ErrorSet errors;
    WarningSet warnings;
};

DayIssues detect_issues(const DailyResult& result,
                        const std::vector<BookingEvent>& bookings,
                        const ScheduleConfig& schedule);

// 合并到结果中, 重复调用结果不变
void merge_issues(DailyResult& result, const DayIssues& issues);

// 检测并合并, 返回新的结果; 非正常工作日原样返回
DailyResult annotate_day(DailyResult result,
                         const std::vector<BookingEvent>& bookings,
                         const ScheduleConfig& schedule);

} // namespace core

#endif // CORE_ERROR_DETECTOR_H
