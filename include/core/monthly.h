/**
 * @file monthly.h
 * @brief 月度汇总 - 把一个月的 DailyResult 汇总为 MonthlyResult, 并维护 开放/已结 状态
 */

#ifndef CORE_MONTHLY_H
#define CORE_MONTHLY_H

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/date_time/gregorian/gregorian.hpp>

#include "core/time_types.h"

namespace core {

/**
 * @brief 月度弹性时间入账规则, 未设置的上限不生效
 */
struct MonthlyEvaluation {
    CreditType credit_type = CreditType::NoEvaluation;
    std::optional<int> flextime_threshold;      // after_threshold: 低于该值的加班不入账
    std::optional<int> max_flextime_per_month;  // 每月最多入账
    std::optional<int> flextime_cap_positive;   // 余额上限
    std::optional<int> flextime_cap_negative;   // 余额下限 (以正数保存)
    std::optional<int> annual_floor_balance;    // 年末余额下限 (以正数保存)
};

struct MonthlyResult {
    int year = 0;
    int month = 0;

    int gross_minutes = 0;
    int net_minutes = 0;
    int target_minutes = 0;
    int overtime_minutes = 0;
    int undertime_minutes = 0;
    int break_minutes = 0;

    // 弹性时间 (分钟)
    int flextime_start = 0;       // 上月结转
    int flextime_change = 0;      // 加班 - 欠班
    int flextime_raw = 0;         // start + change
    int flextime_credited = 0;
    int flextime_forfeited = 0;
    int flextime_end = 0;         // 结转到下月

    int work_days = 0;
    int error_days = 0;
    Decimal vacation_days;
    Decimal sick_days;
    Decimal other_absence_days;

    WarningSet warnings;

    bool is_closed = false;
    std::string closed_by;
    std::time_t closed_at = 0;
    std::string reopened_by;
    std::time_t reopened_at = 0;
};

/**
 * @brief 汇总一个月
 * @param previous_carryover 上月 flextime_end
 * @param rules 入账规则, 为空时按 no_evaluation 直接入账
 */
MonthlyResult aggregate_month(int year, int month,
                              const std::vector<DailyResult>& days,
                              int previous_carryover,
                              const std::optional<MonthlyEvaluation>& rules);

// 余额上下限; forfeited 返回超过上限被没收的分钟数 (低于下限抬高的部分不计)
int apply_flextime_caps(int flextime,
                        const std::optional<int>& cap_positive,
                        const std::optional<int>& cap_negative,
                        int& forfeited);

// 年末结转: 低于 -annual_floor 时取 -annual_floor
int annual_carryover(int balance, const std::optional<int>& annual_floor);

/**
 * @brief 单个员工一个月的工作表
 * @details 开放时每次日计算都 upsert 到表中并重新汇总;
 *          close 会从头重算后冻结, 已结月份拒绝任何修改直到 reopen。
 *          本类不做加锁, 持久化层的条件写保证并发安全。
 */
class MonthSheet {
public:
    MonthSheet(int year, int month,
               int previous_carryover = 0,
               std::optional<MonthlyEvaluation> rules = std::nullopt);

    // 日期不属于本月返回 OutOfRange, 已结返回 AlreadyClosed
    TransitionStatus upsert_day(const boost::gregorian::date& date, const DailyResult& result);

    TransitionStatus close(const std::string& actor, std::time_t at);
    TransitionStatus reopen(const std::string& actor, std::time_t at);

    bool contains(const boost::gregorian::date& date) const;
    bool is_closed() const { return result_.is_closed; }
    size_t day_count() const { return days_.size(); }
    const MonthlyResult& result() const { return result_; }

private:
    void recompute();

    int previous_carryover_;
    std::optional<MonthlyEvaluation> rules_;
    std::map<boost::gregorian::date, DailyResult> days_;
    MonthlyResult result_;
};

} // namespace core

#endif // CORE_MONTHLY_H
