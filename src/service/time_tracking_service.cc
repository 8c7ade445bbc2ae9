/**
 * @file time_tracking_service.cc
 * @brief 工时业务逻辑实现
 * @details 日计算结果按 (员工, 日期) upsert; 月值由已存日值从头重算;
 *          月结/年结的状态检查都放在数据库条件写里, 这里只负责编排和日志。
 */

#include "service/time_tracking_service.h"

#include <iostream>

#include "config.h"
#include "core/codes.h"
#include "database/account_dao.h"
#include "database/daily_value_dao.h"
#include "database/monthly_value_dao.h"

namespace service {

namespace {

const char* status_text(db::WriteStatus status) {
    switch (status) {
        case db::WriteStatus::Written:  return "written";
        case db::WriteStatus::Rejected: return "rejected (closed)";
        case db::WriteStatus::Failed:   return "failed";
    }
    return "";
}

void log_transition(const char* what, const std::string& employee_id,
                    const std::optional<core::TransitionStatus>& status) {
    if (!status) {
        std::cerr << what << " for " << employee_id << " failed: database error" << std::endl;
    } else if (*status != core::TransitionStatus::Ok) {
        std::cerr << what << " for " << employee_id << " rejected: " << core::to_string(*status) << std::endl;
    } else {
        std::cout << what << " for " << employee_id << " done" << std::endl;
    }
}

} // namespace

TimeTrackingService::TimeTrackingService() {}

void TimeTrackingService::register_plan(const core::ScheduleConfig& plan) {
    plans_[plan.code] = plan;
}

const core::ScheduleConfig* TimeTrackingService::find_plan(const std::string& code) const {
    auto it = plans_.find(code);
    return it == plans_.end() ? nullptr : &it->second;
}

DayOutcome TimeTrackingService::recalculate_day(const std::string& employee_id,
                                                const boost::gregorian::date& date,
                                                core::DayInput input) {
    if (!input.plan_lookup) {
        input.plan_lookup = [this](const std::string& code) { return find_plan(code); };
    }

    DayOutcome outcome;
    outcome.result = core::calculate_day(input);

    db::DailyValueDao dao;
    if (!outcome.result) {
        // skip 策略: 该日不产生结果, 清掉旧值
        outcome.status = dao.remove(employee_id, date);
        std::cout << "Employee " << employee_id << " " << db::to_db_date(date)
                  << " skipped (no bookings): " << status_text(outcome.status) << std::endl;
        return outcome;
    }

    outcome.status = dao.upsert(employee_id, date, *outcome.result);
    const core::DailyResult& r = *outcome.result;
    if (outcome.status == db::WriteStatus::Written) {
        std::cout << "Employee " << employee_id << " " << db::to_db_date(date)
                  << " recalculated: kind=" << core::to_string(r.kind)
                  << ", net=" << r.net_minutes << ", target=" << r.target_minutes
                  << ", errors=[" << core::join_codes(r.errors) << "]" << std::endl;
    } else {
        std::cerr << "Employee " << employee_id << " " << db::to_db_date(date)
                  << " daily value " << status_text(outcome.status) << std::endl;
    }
    return outcome;
}

DayOutcome TimeTrackingService::recalculate_day(const std::string& employee_id,
                                                const boost::gregorian::date& date,
                                                const std::string& plan_code,
                                                const std::vector<core::BookingEvent>& bookings,
                                                const std::optional<core::AbsenceFact>& absence,
                                                bool is_holiday,
                                                const std::optional<int>& holiday_category) {
    core::DayInput input;
    if (!plan_code.empty()) {
        const core::ScheduleConfig* plan = find_plan(plan_code);
        if (plan) {
            input.schedule = *plan;
        } else {
            std::cerr << "Unknown day plan '" << plan_code << "', treated as off day" << std::endl;
        }
    }
    input.bookings = bookings;
    input.absence = absence;
    input.is_holiday = is_holiday;
    input.holiday_category = holiday_category;
    return recalculate_day(employee_id, date, std::move(input));
}

int TimeTrackingService::previous_carryover(const std::string& employee_id, int year, int month) {
    db::MonthlyValueDao monthly_dao;
    int prev_year = month == 1 ? year - 1 : year;
    int prev_month = month == 1 ? 12 : month - 1;

    // 上一年已结账时, 一月从年末封顶后的期初余额开始
    std::optional<core::AccountLedgerEntry> opening;
    if (month == 1) {
        db::AccountDao account_dao;
        opening = account_dao.get(employee_id, core::AccountKind::Flextime, year);
        auto closed = account_dao.get(employee_id, core::AccountKind::Flextime, prev_year);
        if (opening && closed && closed->is_closed) {
            return static_cast<int>(opening->opening_balance.round_to_int());
        }
    }

    auto prev = monthly_dao.get(employee_id, prev_year, prev_month);
    if (prev) return prev->flextime_end;

    if (opening) return static_cast<int>(opening->opening_balance.round_to_int());
    return 0;
}

MonthOutcome TimeTrackingService::recalculate_month(const std::string& employee_id, int year, int month) {
    MonthOutcome outcome;
    if (month < 1 || month > Config::Policy::MAX_MONTHS_PER_YEAR) {
        std::cerr << "Invalid month " << year << "-" << month << std::endl;
        return outcome;
    }

    core::MonthSheet sheet(year, month, previous_carryover(employee_id, year, month), evaluation_);

    db::DailyValueDao daily_dao;
    for (const auto& day : daily_dao.get_month(employee_id, year, month)) {
        if (sheet.upsert_day(day.first, day.second) != core::TransitionStatus::Ok) {
            std::cerr << "Daily value " << db::to_db_date(day.first) << " not part of month, ignored" << std::endl;
        }
    }

    db::MonthlyValueDao monthly_dao;
    outcome.result = sheet.result();
    outcome.status = monthly_dao.upsert(employee_id, sheet.result());

    if (outcome.status == db::WriteStatus::Written) {
        std::cout << "Employee " << employee_id << " month " << year << "-" << month
                  << " recalculated: days=" << sheet.day_count()
                  << ", flextime_end=" << sheet.result().flextime_end << std::endl;
        sync_ledger(employee_id, year);
    } else {
        std::cerr << "Employee " << employee_id << " month " << year << "-" << month
                  << " " << status_text(outcome.status) << std::endl;
    }
    return outcome;
}

void TimeTrackingService::sync_ledger(const std::string& employee_id, int year) {
    db::MonthlyValueDao monthly_dao;
    db::AccountDao account_dao;

    std::optional<core::MonthlyResult> latest;
    core::Decimal vacation_used;
    for (int m = 1; m <= Config::Policy::MAX_MONTHS_PER_YEAR; ++m) {
        auto value = monthly_dao.get(employee_id, year, m);
        if (!value) continue;
        vacation_used += value->vacation_days;
        latest = value;
    }
    if (!latest) return;

    core::AccountLedgerEntry flextime;
    flextime.employee_id = employee_id;
    flextime.kind = core::AccountKind::Flextime;
    flextime.year = year;
    if (auto stored = account_dao.get(employee_id, core::AccountKind::Flextime, year)) {
        flextime = *stored;
    }
    flextime.current_balance = core::Decimal::from_int(latest->flextime_end);

    core::AccountLedgerEntry vacation;
    vacation.employee_id = employee_id;
    vacation.kind = core::AccountKind::Vacation;
    vacation.year = year;
    if (auto stored = account_dao.get(employee_id, core::AccountKind::Vacation, year)) {
        vacation = *stored;
    }
    vacation.used = vacation_used;

    for (const auto* entry : {&flextime, &vacation}) {
        db::WriteStatus status = account_dao.upsert(*entry);
        if (status != db::WriteStatus::Written) {
            std::cerr << "Ledger " << core::to_string(entry->kind) << " " << year << " for "
                      << employee_id << " " << status_text(status) << std::endl;
        }
    }
}

std::optional<core::TransitionStatus> TimeTrackingService::close_month(const std::string& employee_id,
                                                                       int year, int month,
                                                                       const std::string& actor,
                                                                       std::time_t at) {
    // 先从头重算, 再做条件关闭
    MonthOutcome outcome = recalculate_month(employee_id, year, month);
    if (outcome.status == db::WriteStatus::Failed) {
        log_transition("Close month", employee_id, std::nullopt);
        return std::nullopt;
    }
    if (outcome.status == db::WriteStatus::Rejected) {
        log_transition("Close month", employee_id, core::TransitionStatus::AlreadyClosed);
        return core::TransitionStatus::AlreadyClosed;
    }

    db::MonthlyValueDao dao;
    auto status = dao.close(employee_id, year, month, actor, at);
    log_transition("Close month", employee_id, status);
    return status;
}

std::optional<core::TransitionStatus> TimeTrackingService::reopen_month(const std::string& employee_id,
                                                                        int year, int month,
                                                                        const std::string& actor,
                                                                        std::time_t at) {
    db::MonthlyValueDao dao;
    auto status = dao.reopen(employee_id, year, month, actor, at);
    log_transition("Reopen month", employee_id, status);
    return status;
}

std::optional<core::VacationCalcOutput> TimeTrackingService::assign_vacation(const std::string& employee_id,
                                                                             const core::VacationCalcInput& input) {
    core::VacationCalcOutput output = core::calculate_vacation(input);

    db::AccountDao dao;
    core::AccountLedgerEntry entry;
    entry.employee_id = employee_id;
    entry.kind = core::AccountKind::Vacation;
    entry.year = input.year;
    if (auto stored = dao.get(employee_id, core::AccountKind::Vacation, input.year)) {
        entry = *stored;
    }
    entry.yearly_entitlement = output.total_entitlement;

    db::WriteStatus status = dao.upsert(entry);
    if (status != db::WriteStatus::Written) {
        std::cerr << "Vacation entitlement " << input.year << " for " << employee_id << " "
                  << status_text(status) << std::endl;
        return std::nullopt;
    }
    std::cout << "Vacation entitlement " << input.year << " for " << employee_id << ": "
              << output.total_entitlement.to_string() << " days" << std::endl;
    return output;
}

std::optional<core::TransitionStatus> TimeTrackingService::close_year(const std::string& employee_id,
                                                                      core::AccountKind kind, int year) {
    core::YearEndCaps caps;
    auto it = caps_.find(kind);
    if (it != caps_.end()) caps = it->second;

    // 月度规则里的年末下限作为弹性时间的负余额上限
    if (kind == core::AccountKind::Flextime && !caps.negative_limit &&
        evaluation_ && evaluation_->annual_floor_balance) {
        caps.negative_limit = core::Decimal::from_int(*evaluation_->annual_floor_balance);
    }

    db::AccountDao dao;
    auto status = dao.close_year(employee_id, kind, year, caps);
    log_transition("Close year", employee_id, status);
    return status;
}

std::optional<core::TransitionStatus> TimeTrackingService::reopen_year(const std::string& employee_id,
                                                                       core::AccountKind kind, int year) {
    db::AccountDao dao;
    auto status = dao.reopen_year(employee_id, kind, year);
    log_transition("Reopen year", employee_id, status);
    return status;
}

} // namespace service
