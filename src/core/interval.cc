/**
 * @file interval.cc
 * @brief 分钟区间运算实现
 */

#include "core/interval.h"

#include <algorithm>

namespace core {

int overlap_minutes(int start1, int end1, int start2, int end2) {
    int start = std::max(start1, start2);
    int end = std::min(end1, end2);
    return end > start ? end - start : 0;
}

bool in_window(int time, const std::optional<int>& from, const std::optional<int>& to) {
    if (!from || !to) return false;
    return time >= *from && time <= *to;
}

std::vector<TimePair> pairs_of_kind(const std::vector<TimePair>& pairs, PairKind kind) {
    std::vector<TimePair> out;
    for (const auto& p : pairs) {
        if (p.kind == kind) out.push_back(p);
    }
    return out;
}

int total_duration(const std::vector<TimePair>& pairs) {
    int total = 0;
    for (const auto& p : pairs) {
        if (p.duration() > 0) total += p.duration();
    }
    return total;
}

} // namespace core
