/**
 * @file interval.h
 * @brief 分钟区间的基础运算
 */

#ifndef CORE_INTERVAL_H
#define CORE_INTERVAL_H

#include <vector>

#include "core/time_types.h"

namespace core {

// [s1, e1) 与 [s2, e2) 的重叠分钟数, 无重叠为 0
int overlap_minutes(int start1, int end1, int start2, int end2);

// 时刻是否在闭区间 [from, to] 内; 任一边界未设置返回 false
bool in_window(int time, const std::optional<int>& from, const std::optional<int>& to);

// 取出指定类型的配对 (保持原顺序)
std::vector<TimePair> pairs_of_kind(const std::vector<TimePair>& pairs, PairKind kind);

// 配对时长之和 (负时长按 0 计)
int total_duration(const std::vector<TimePair>& pairs);

} // namespace core

#endif // CORE_INTERVAL_H
