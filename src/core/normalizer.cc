/**
 * @file normalizer.cc
 * @brief 容差与取整实现
 */

#include "core/normalizer.h"

#include <algorithm>

#include "config.h"

namespace core {

int apply_rounding(int time, RoundingMode mode, int interval) {
    if (interval <= 0) return time;

    int remainder = time % interval;
    switch (mode) {
        case RoundingMode::None:
            return time;
        case RoundingMode::Up:
            return remainder == 0 ? time : time + (interval - remainder);
        case RoundingMode::Down:
            return time - remainder;
        case RoundingMode::Nearest:
            if (remainder * 2 >= interval) {
                return time + (interval - remainder);
            }
            return time - remainder;
    }
    return time;
}

int apply_rounding(int time, const RoundingRule& rule) {
    int rounded = apply_rounding(time, rule.mode, rule.interval) + rule.offset;
    return std::clamp(rounded, 0, Config::Time::DAY_END);
}

int apply_come_tolerance(int time, const std::optional<int>& come_from, const Tolerance& tolerance) {
    if (!come_from) return time;
    if (time >= *come_from - tolerance.come_minus && time <= *come_from + tolerance.come_plus) {
        return *come_from;
    }
    return time;
}

int apply_go_tolerance(int time,
                       const std::optional<int>& go_from,
                       const std::optional<int>& go_to,
                       const Tolerance& tolerance) {
    const std::optional<int>& expected = go_to ? go_to : go_from;
    if (!expected) return time;
    if (time >= *expected - tolerance.go_minus && time <= *expected + tolerance.go_plus) {
        return *expected;
    }
    return time;
}

NormalizedPairs normalize_work_pairs(const std::vector<TimePair>& work_pairs,
                                     const ScheduleConfig& schedule) {
    NormalizedPairs out;
    out.pairs = work_pairs;
    if (out.pairs.empty()) return out;

    size_t first = 0;
    size_t last = 0;
    for (size_t i = 1; i < out.pairs.size(); ++i) {
        if (out.pairs[i].start < out.pairs[first].start) first = i;
        if (out.pairs[i].end > out.pairs[last].end) last = i;
    }

    // 1. 容差
    out.pairs[first].start = apply_come_tolerance(out.pairs[first].start, schedule.come_from,
                                                  schedule.tolerance);
    out.pairs[last].end = apply_go_tolerance(out.pairs[last].end, schedule.go_from,
                                             schedule.go_to, schedule.tolerance);

    // 2. 取整
    for (size_t i = 0; i < out.pairs.size(); ++i) {
        if (schedule.round_all_bookings || i == first) {
            out.pairs[i].start = apply_rounding(out.pairs[i].start, schedule.rounding_come);
        }
        if (schedule.round_all_bookings || i == last) {
            out.pairs[i].end = apply_rounding(out.pairs[i].end, schedule.rounding_go);
        }
    }

    out.first_start = out.pairs[first].start;
    out.last_end = out.pairs[last].end;

    // 3. 评估窗口截断
    if (schedule.cap_to_window && (schedule.come_from || schedule.go_to)) {
        int window_start = 0;
        if (schedule.come_from) {
            window_start = *schedule.come_from;
            if (schedule.kind == PlanKind::Flextime) {
                window_start -= schedule.tolerance.come_minus;
            }
        }
        int window_end = schedule.go_to ? *schedule.go_to + schedule.tolerance.go_plus
                                        : Config::Time::DAY_END;
        if (window_start > window_end) return out;

        for (auto& p : out.pairs) {
            int before = std::max(p.duration(), 0);
            p.start = std::clamp(p.start, window_start, window_end);
            p.end = std::clamp(p.end, window_start, window_end);
            out.capped_minutes += before - std::max(p.duration(), 0);
        }
    }

    return out;
}

} // namespace core
