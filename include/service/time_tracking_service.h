/**
 * @file time_tracking_service.h
 * @brief 工时业务服务头文件
 * @details 持有日计划注册表, 负责 "计算 -> 检测 -> 受保护写入" 的完整流程,
 *          以及月结/反结、年结/反结。所有写操作在月/年已结时被拒绝并记录日志。
 */

#ifndef TIME_TRACKING_SERVICE_H
#define TIME_TRACKING_SERVICE_H

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/daily_calculator.h"
#include "core/ledger.h"
#include "core/monthly.h"
#include "core/vacation.h"
#include "database/database_types.h"

namespace service {

struct DayOutcome {
    db::WriteStatus status = db::WriteStatus::Failed;
    std::optional<core::DailyResult> result;    // skip 策略时为空
};

struct MonthOutcome {
    db::WriteStatus status = db::WriteStatus::Failed;
    std::optional<core::MonthlyResult> result;
};

class TimeTrackingService {
public:
    TimeTrackingService();

    // 日计划注册表 (班次识别的备选计划也从这里查)
    void register_plan(const core::ScheduleConfig& plan);
    const core::ScheduleConfig* find_plan(const std::string& code) const;
    size_t plan_count() const { return plans_.size(); }

    void set_monthly_evaluation(std::optional<core::MonthlyEvaluation> rules) { evaluation_ = std::move(rules); }
    void set_year_end_caps(core::AccountKind kind, const core::YearEndCaps& caps) { caps_[kind] = caps; }

    /**
     * @brief 重新计算一天并写入
     * @param input 当天输入; plan_lookup 为空时使用本服务的注册表
     * @return skip 策略时删除已存结果; 月已结时 status = Rejected
     */
    DayOutcome recalculate_day(const std::string& employee_id,
                               const boost::gregorian::date& date,
                               core::DayInput input);

    // 按计划代码组装输入; 代码为空表示休息日, 未注册的代码同样按休息日处理并记录日志
    DayOutcome recalculate_day(const std::string& employee_id,
                               const boost::gregorian::date& date,
                               const std::string& plan_code,
                               const std::vector<core::BookingEvent>& bookings,
                               const std::optional<core::AbsenceFact>& absence = std::nullopt,
                               bool is_holiday = false,
                               const std::optional<int>& holiday_category = std::nullopt);

    // 用已存日值重算月值, 并同步当年弹性时间/年假台账
    MonthOutcome recalculate_month(const std::string& employee_id, int year, int month);

    // 重算后 compare-and-set 月结; 返回 std::nullopt 表示数据库错误
    std::optional<core::TransitionStatus> close_month(const std::string& employee_id, int year, int month,
                                                      const std::string& actor,
                                                      std::time_t at = std::time(nullptr));
    std::optional<core::TransitionStatus> reopen_month(const std::string& employee_id, int year, int month,
                                                       const std::string& actor,
                                                       std::time_t at = std::time(nullptr));

    // 计算年假并写入当年年假台账的 yearly_entitlement
    std::optional<core::VacationCalcOutput> assign_vacation(const std::string& employee_id,
                                                            const core::VacationCalcInput& input);

    std::optional<core::TransitionStatus> close_year(const std::string& employee_id,
                                                     core::AccountKind kind, int year);
    std::optional<core::TransitionStatus> reopen_year(const std::string& employee_id,
                                                      core::AccountKind kind, int year);

private:
    // 上月结转: 上月月值的 flextime_end; 1 月没有上月记录时取当年弹性时间台账的期初余额
    int previous_carryover(const std::string& employee_id, int year, int month);

    // 用当年已存月值刷新弹性时间余额和已休年假
    void sync_ledger(const std::string& employee_id, int year);

    std::map<std::string, core::ScheduleConfig> plans_;
    std::optional<core::MonthlyEvaluation> evaluation_;
    std::map<core::AccountKind, core::YearEndCaps> caps_;
};

} // namespace service

#endif // TIME_TRACKING_SERVICE_H
