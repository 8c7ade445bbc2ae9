/**
 * @file pairing.h
 * @brief 打卡配对 - 把无序的来/走/休息打卡组合成工作区间和休息区间
 */

#ifndef CORE_PAIRING_H
#define CORE_PAIRING_H

#include <string>
#include <vector>

#include "core/time_types.h"

namespace core {

struct PairingResult {
    std::vector<TimePair> pairs;          // 先工作配对, 后休息配对, 各自按开始时间排序
    std::vector<std::string> unpaired_ids;
    ErrorSet errors;                      // MISSING_GO / MISSING_COME / MISSING_BREAK_*
};

/**
 * @brief 配对一天的打卡
 * @details 按类别拆成四个列表, 各自按生效时间排序 (同一时间按 id 排序),
 *          每个开始打卡匹配 "时间严格大于它且尚未使用的最早结束打卡"。
 *          结果与输入顺序无关。
 */
PairingResult pair_bookings(const std::vector<BookingEvent>& bookings);

// 最早的来打卡 / 最晚的走打卡 (原始生效时间, 未做容差和取整)
std::optional<int> find_first_come(const std::vector<BookingEvent>& bookings);
std::optional<int> find_last_go(const std::vector<BookingEvent>& bookings);

} // namespace core

#endif // CORE_PAIRING_H
