/**
 * @file time_types.h
 * @brief 工时计算引擎的数据结构定义
 * @details 所有时刻均为 "距午夜的整数分钟", 时刻取值 [0, 1440), 窗口结束取值 [0, 1440]。
 *          未设置的可选字段 (std::nullopt) 表示对应规则不生效。
 */

#ifndef CORE_TIME_TYPES_H
#define CORE_TIME_TYPES_H

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/decimal.h"

namespace core {

// ============================================
// 枚举定义 (字符串编码只在持久化/JSON 边界使用, 见 codes.h)
// ============================================

enum class PlanKind { Fixed, Flextime };

enum class BookingCategory { Come, Go, BreakStart, BreakEnd };

enum class PairKind { Work, Break };

enum class RoundingMode { None, Up, Down, Nearest };

enum class BreakKind { Fixed, Variable, Minimum };

// 无打卡日处理策略
enum class NoBookingPolicy { Error, CreditTarget, CreditZero, Skip, UseAbsence };

enum class DayKind { Normal, Absence, Holiday, OffDay, NoBookings };

enum class AbsenceKind { Vacation, Sick, Other };

// 班次识别命中方式
enum class ShiftMatch { None, Arrival, Departure, Both };

// 月度弹性时间入账方式
enum class CreditType { NoEvaluation, CompleteCarryover, AfterThreshold, NoCarryover };

enum class AccountKind { Flextime, Vacation, Overtime, Surcharge };

// 月/年结状态迁移结果
enum class TransitionStatus { Ok, AlreadyClosed, NotClosed, OutOfRange };

enum class ErrorCode {
    MissingCome,
    MissingGo,
    MissingBreakStart,
    MissingBreakEnd,
    CameBeforeAllowed,
    LeftAfterAllowed,
    MissedCoreTime,
    OverlappingBookings,
    NegativeDuration,
    NoBookings,
    BelowMinWorkTime,
    NoMatchingShift,
};

enum class WarningCode {
    LateArrival,
    EarlyDeparture,
    LongWorkDay,
    NetTimeCapped,
    ManualBreak,
    AutoBreakApplied,
    NoBreakRecorded,
    WindowCapped,
    OffDay,
    BookingsOnOffDay,
    Holiday,
    AbsenceOnHoliday,
    BookingsOnAbsenceDay,
    NoBookingsCredited,
    NoBookingsDeducted,
    NoBookingsAbsenceApplied,
    MonthlyCapReached,
    FlextimeCapped,
    BelowThreshold,
    NoCarryover,
};

// 用 set 保存, 重复代码在结构上不可能出现
using ErrorSet = std::set<ErrorCode>;
using WarningSet = std::set<WarningCode>;

// ============================================
// 日计划 (Day Plan)
// ============================================

/**
 * @brief 容差: 来/走时间在窗口附近的宽限带
 */
struct Tolerance {
    int come_plus = 0;   // 迟到宽限
    int come_minus = 0;  // 早到宽限
    int go_plus = 0;     // 晚走宽限
    int go_minus = 0;    // 早走宽限
};

/**
 * @brief 取整规则, interval <= 0 或 mode == None 时不取整
 */
struct RoundingRule {
    RoundingMode mode = RoundingMode::None;
    int interval = 0;
    int offset = 0;      // 取整后再加 (正) / 减 (负) 的分钟数
};

struct BreakRule {
    BreakKind kind = BreakKind::Fixed;
    std::optional<int> start;               // 仅 fixed: 休息窗口开始
    std::optional<int> end;                 // 仅 fixed: 休息窗口结束
    int duration = 0;
    std::optional<int> after_work_minutes;  // 仅 minimum: 工作超过该值后强制休息
    bool auto_deduct = false;
    bool paid = false;                      // 带薪休息: 计入休息时间但不从净工时扣除
    bool proportional = false;              // minimum: 只扣超出阈值的部分 (最多 duration)
};

/**
 * @brief 附加时间窗口 (夜班/节假日加成), 不允许跨午夜
 */
struct SurchargeRule {
    std::string account;                    // 目标账户代码
    int time_from = 0;                      // [time_from, time_to)
    int time_to = 0;
    bool applies_on_workday = true;
    bool applies_on_holiday = false;
    std::vector<int> holiday_categories;    // 为空表示所有类别
};

struct SurchargeResult {
    std::string account;
    int minutes = 0;
};

/**
 * @brief 缺勤信息 (休假/病假/其他)
 */
struct AbsenceFact {
    std::string type_code;
    AbsenceKind kind = AbsenceKind::Other;
    bool credits_hours = true;
    Decimal duration_fraction = Decimal::from_int(1);  // 1.0 全天, 0.5 半天
    Decimal portion = Decimal::from_int(1);            // 计入比例
    int priority = 0;                                  // 与节假日冲突时, 高者生效
};

struct ScheduleConfig {
    std::string code;
    std::string name;
    PlanKind kind = PlanKind::Fixed;
    int target_minutes = 0;

    // 来/走窗口
    std::optional<int> come_from;
    std::optional<int> come_to;
    std::optional<int> go_from;
    std::optional<int> go_to;

    // 核心时间 (弹性工时)
    std::optional<int> core_start;
    std::optional<int> core_end;

    Tolerance tolerance;
    RoundingRule rounding_come;
    RoundingRule rounding_go;
    bool round_all_bookings = false;
    bool cap_to_window = false;

    std::vector<BreakRule> breaks;

    std::optional<int> min_net_work_time;
    std::optional<int> max_net_work_time;

    // 节假日类别 -> 计入分钟数; 未配置的类别使用默认值 (见 holiday_credit_for)
    std::map<int, int> holiday_credit;
    int holiday_priority = 0;

    NoBookingPolicy no_booking_policy = NoBookingPolicy::Error;
    std::optional<AbsenceFact> no_booking_absence;

    // 班次识别窗口
    std::optional<int> detect_arrive_from;
    std::optional<int> detect_arrive_to;
    std::optional<int> detect_depart_from;
    std::optional<int> detect_depart_to;
    std::vector<std::string> alternative_plans;   // 最多 6 个日计划代码

    std::vector<SurchargeRule> surcharges;
};

// 按代码查找日计划, 找不到返回 nullptr
using PlanLookup = std::function<const ScheduleConfig*(const std::string& code)>;

// ============================================
// 打卡与配对
// ============================================

struct BookingEvent {
    std::string id;
    BookingCategory category = BookingCategory::Come;
    int original_time = 0;
    std::optional<int> edited_time;   // 人工修正后的时间, 原始时间保持不变

    int effective_time() const { return edited_time ? *edited_time : original_time; }
};

struct TimePair {
    std::string start_id;
    std::string end_id;
    PairKind kind = PairKind::Work;
    int start = 0;
    int end = 0;

    int duration() const { return end - start; }
};

// ============================================
// 计算输入/输出
// ============================================

struct DayInput {
    std::optional<ScheduleConfig> schedule;   // 未分配日计划 = 休息日
    std::vector<BookingEvent> bookings;
    std::optional<AbsenceFact> absence;
    bool is_holiday = false;
    std::optional<int> holiday_category;
    PlanLookup plan_lookup;                   // 班次识别使用, 可为空
};

struct DailyResult {
    DayKind kind = DayKind::Normal;
    std::string plan_code;                    // 实际使用的日计划 (班次识别后)
    int gross_minutes = 0;
    int net_minutes = 0;
    int target_minutes = 0;
    int overtime_minutes = 0;
    int undertime_minutes = 0;
    int break_minutes = 0;
    int paid_break_minutes = 0;
    int capped_minutes = 0;
    int booking_count = 0;
    std::optional<int> first_come;
    std::optional<int> last_go;
    std::vector<TimePair> pairs;
    std::vector<SurchargeResult> surcharges;
    std::optional<AbsenceKind> absence_kind;
    Decimal absence_fraction;
    ErrorSet errors;
    WarningSet warnings;

    bool has_error() const { return !errors.empty(); }
};

} // namespace core

#endif // CORE_TIME_TYPES_H
