/**
 * @file normalizer.h
 * @brief 容差与取整 - 对工作配对的边界时间做规范化
 * @details 固定顺序: 先容差, 后取整, 最后 (可选) 评估窗口截断。
 *          所有函数返回新值, 不修改输入。
 */

#ifndef CORE_NORMALIZER_H
#define CORE_NORMALIZER_H

#include <vector>

#include "core/time_types.h"

namespace core {

/**
 * @brief 按方向取整
 * @details up: 向上取到 interval 的倍数 (已是倍数则不变);
 *          down: 向下取;
 *          nearest: 取较近的倍数, 余数 >= interval/2 时向上。
 *          interval <= 0 或 mode == None 时原样返回。
 */
int apply_rounding(int time, RoundingMode mode, int interval);

// 取整后再加上 rule.offset, 结果限制在 [0, 1440]
int apply_rounding(int time, const RoundingRule& rule);

// 来打卡落在 [come_from - come_minus, come_from + come_plus] 内时视为准时 (= come_from)
int apply_come_tolerance(int time, const std::optional<int>& come_from, const Tolerance& tolerance);

// 走打卡以 go_to 为基准 (未设置时用 go_from), 落在 [基准 - go_minus, 基准 + go_plus] 内视为准时
int apply_go_tolerance(int time,
                       const std::optional<int>& go_from,
                       const std::optional<int>& go_to,
                       const Tolerance& tolerance);

struct NormalizedPairs {
    std::vector<TimePair> pairs;
    int capped_minutes = 0;   // 评估窗口截断掉的分钟数
    // 容差和取整之后、窗口截断之前的首个开始/最后结束, 用于窗口违规检查
    std::optional<int> first_start;
    std::optional<int> last_end;
};

/**
 * @brief 规范化工作配对
 * @details 容差只作用于最早的来和最晚的走; 取整默认同样只作用于这两个边界,
 *          round_all_bookings 为 true 时作用于所有边界。
 *          cap_to_window 为 true 时再把区间截断到 [come_from(-come_minus 弹性), go_to + go_plus]。
 */
NormalizedPairs normalize_work_pairs(const std::vector<TimePair>& work_pairs,
                                     const ScheduleConfig& schedule);

} // namespace core

#endif // CORE_NORMALIZER_H
