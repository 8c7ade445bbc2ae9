/**
 * @file pairing.cc
 * @brief 打卡配对实现
 */

#include "core/pairing.h"

#include <algorithm>

namespace core {

namespace {

std::vector<const BookingEvent*> sorted_of(const std::vector<BookingEvent>& bookings,
                                           BookingCategory category) {
    std::vector<const BookingEvent*> out;
    for (const auto& b : bookings) {
        if (b.category == category) out.push_back(&b);
    }
    std::sort(out.begin(), out.end(), [](const BookingEvent* a, const BookingEvent* b) {
        if (a->effective_time() != b->effective_time()) {
            return a->effective_time() < b->effective_time();
        }
        return a->id < b->id;
    });
    return out;
}

// 顺序贪心配对, 未配对的 id 追加到 unpaired
void pair_sequential(const std::vector<const BookingEvent*>& starts,
                     const std::vector<const BookingEvent*>& ends,
                     PairKind kind,
                     std::vector<TimePair>& pairs,
                     std::vector<std::string>& unpaired,
                     bool& has_unpaired_start,
                     bool& has_unpaired_end) {
    std::vector<bool> used(ends.size(), false);

    for (const BookingEvent* s : starts) {
        bool matched = false;
        for (size_t i = 0; i < ends.size(); ++i) {
            if (used[i] || ends[i]->effective_time() <= s->effective_time()) continue;

            TimePair p;
            p.start_id = s->id;
            p.end_id = ends[i]->id;
            p.kind = kind;
            p.start = s->effective_time();
            p.end = ends[i]->effective_time();
            pairs.push_back(p);

            used[i] = true;
            matched = true;
            break;
        }
        if (!matched) {
            unpaired.push_back(s->id);
            has_unpaired_start = true;
        }
    }

    for (size_t i = 0; i < ends.size(); ++i) {
        if (!used[i]) {
            unpaired.push_back(ends[i]->id);
            has_unpaired_end = true;
        }
    }
}

} // namespace

PairingResult pair_bookings(const std::vector<BookingEvent>& bookings) {
    PairingResult result;

    auto comes = sorted_of(bookings, BookingCategory::Come);
    auto goes = sorted_of(bookings, BookingCategory::Go);
    auto break_starts = sorted_of(bookings, BookingCategory::BreakStart);
    auto break_ends = sorted_of(bookings, BookingCategory::BreakEnd);

    bool missing_go = false;
    bool missing_come = false;
    pair_sequential(comes, goes, PairKind::Work, result.pairs, result.unpaired_ids,
                    missing_go, missing_come);
    if (missing_go) result.errors.insert(ErrorCode::MissingGo);
    if (missing_come) result.errors.insert(ErrorCode::MissingCome);

    bool missing_break_end = false;
    bool missing_break_start = false;
    pair_sequential(break_starts, break_ends, PairKind::Break, result.pairs, result.unpaired_ids,
                    missing_break_end, missing_break_start);
    if (missing_break_end) result.errors.insert(ErrorCode::MissingBreakEnd);
    if (missing_break_start) result.errors.insert(ErrorCode::MissingBreakStart);

    return result;
}

std::optional<int> find_first_come(const std::vector<BookingEvent>& bookings) {
    std::optional<int> first;
    for (const auto& b : bookings) {
        if (b.category != BookingCategory::Come) continue;
        if (!first || b.effective_time() < *first) first = b.effective_time();
    }
    return first;
}

std::optional<int> find_last_go(const std::vector<BookingEvent>& bookings) {
    std::optional<int> last;
    for (const auto& b : bookings) {
        if (b.category != BookingCategory::Go) continue;
        if (!last || b.effective_time() > *last) last = b.effective_time();
    }
    return last;
}

} // namespace core
