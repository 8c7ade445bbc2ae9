/**
 * @file monthly_value_dao.cc
 * @brief 月值数据访问对象实现
 */

#include "database/monthly_value_dao.h"
#include "database/database_manager.h"
#include "core/codes.h"
#include <iostream>

namespace db {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

// 条件更新 is_closed, 返回受影响行数, 出错返回 -1
int set_closed_state(sqlite3* db, const char* sql, const std::string& employee_id, int year, int month,
                     const std::string& actor, std::time_t at) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_text(stmt, 1, actor.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, static_cast<int64_t>(at));
    sqlite3_bind_text(stmt, 3, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, year);
    sqlite3_bind_int(stmt, 5, month);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Update month state failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }
    return DatabaseManager::instance().changed_rows();
}

} // namespace

WriteStatus MonthlyValueDao::upsert(const std::string& employee_id, const core::MonthlyResult& result) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return WriteStatus::Failed;

    const char* sql =
        "INSERT INTO monthly_values (employee_id, year, month, gross_minutes, net_minutes, target_minutes, "
        "overtime_minutes, undertime_minutes, break_minutes, flextime_start, flextime_change, flextime_raw, "
        "flextime_credited, flextime_forfeited, flextime_end, work_days, error_days, vacation_days_raw, "
        "sick_days_raw, other_absence_days_raw, warning_codes) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(employee_id, year, month) DO UPDATE SET "
        "gross_minutes = excluded.gross_minutes, net_minutes = excluded.net_minutes, "
        "target_minutes = excluded.target_minutes, overtime_minutes = excluded.overtime_minutes, "
        "undertime_minutes = excluded.undertime_minutes, break_minutes = excluded.break_minutes, "
        "flextime_start = excluded.flextime_start, flextime_change = excluded.flextime_change, "
        "flextime_raw = excluded.flextime_raw, flextime_credited = excluded.flextime_credited, "
        "flextime_forfeited = excluded.flextime_forfeited, flextime_end = excluded.flextime_end, "
        "work_days = excluded.work_days, error_days = excluded.error_days, "
        "vacation_days_raw = excluded.vacation_days_raw, sick_days_raw = excluded.sick_days_raw, "
        "other_absence_days_raw = excluded.other_absence_days_raw, warning_codes = excluded.warning_codes "
        "WHERE monthly_values.is_closed = 0";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return WriteStatus::Failed;
    }

    const std::string warnings = core::join_codes(result.warnings);
    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, result.year);
    sqlite3_bind_int(stmt, 3, result.month);
    sqlite3_bind_int(stmt, 4, result.gross_minutes);
    sqlite3_bind_int(stmt, 5, result.net_minutes);
    sqlite3_bind_int(stmt, 6, result.target_minutes);
    sqlite3_bind_int(stmt, 7, result.overtime_minutes);
    sqlite3_bind_int(stmt, 8, result.undertime_minutes);
    sqlite3_bind_int(stmt, 9, result.break_minutes);
    sqlite3_bind_int(stmt, 10, result.flextime_start);
    sqlite3_bind_int(stmt, 11, result.flextime_change);
    sqlite3_bind_int(stmt, 12, result.flextime_raw);
    sqlite3_bind_int(stmt, 13, result.flextime_credited);
    sqlite3_bind_int(stmt, 14, result.flextime_forfeited);
    sqlite3_bind_int(stmt, 15, result.flextime_end);
    sqlite3_bind_int(stmt, 16, result.work_days);
    sqlite3_bind_int(stmt, 17, result.error_days);
    sqlite3_bind_int64(stmt, 18, result.vacation_days.raw());
    sqlite3_bind_int64(stmt, 19, result.sick_days.raw());
    sqlite3_bind_int64(stmt, 20, result.other_absence_days.raw());
    sqlite3_bind_text(stmt, 21, warnings.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::cerr << "Upsert monthly value failed: " << sqlite3_errmsg(db) << std::endl;
        return WriteStatus::Failed;
    }
    return DatabaseManager::instance().changed_rows() > 0 ? WriteStatus::Written : WriteStatus::Rejected;
}

std::optional<core::MonthlyResult> MonthlyValueDao::get(const std::string& employee_id, int year, int month) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "SELECT gross_minutes, net_minutes, target_minutes, overtime_minutes, undertime_minutes, break_minutes, "
        "flextime_start, flextime_change, flextime_raw, flextime_credited, flextime_forfeited, flextime_end, "
        "work_days, error_days, vacation_days_raw, sick_days_raw, other_absence_days_raw, warning_codes, "
        "is_closed, closed_by, closed_at, reopened_by, reopened_at "
        "FROM monthly_values WHERE employee_id = ? AND year = ? AND month = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, year);
    sqlite3_bind_int(stmt, 3, month);

    std::optional<core::MonthlyResult> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        core::MonthlyResult r;
        r.year = year;
        r.month = month;
        r.gross_minutes = sqlite3_column_int(stmt, 0);
        r.net_minutes = sqlite3_column_int(stmt, 1);
        r.target_minutes = sqlite3_column_int(stmt, 2);
        r.overtime_minutes = sqlite3_column_int(stmt, 3);
        r.undertime_minutes = sqlite3_column_int(stmt, 4);
        r.break_minutes = sqlite3_column_int(stmt, 5);
        r.flextime_start = sqlite3_column_int(stmt, 6);
        r.flextime_change = sqlite3_column_int(stmt, 7);
        r.flextime_raw = sqlite3_column_int(stmt, 8);
        r.flextime_credited = sqlite3_column_int(stmt, 9);
        r.flextime_forfeited = sqlite3_column_int(stmt, 10);
        r.flextime_end = sqlite3_column_int(stmt, 11);
        r.work_days = sqlite3_column_int(stmt, 12);
        r.error_days = sqlite3_column_int(stmt, 13);
        r.vacation_days = core::Decimal::from_raw(sqlite3_column_int64(stmt, 14));
        r.sick_days = core::Decimal::from_raw(sqlite3_column_int64(stmt, 15));
        r.other_absence_days = core::Decimal::from_raw(sqlite3_column_int64(stmt, 16));
        if (!core::split_codes(column_text(stmt, 17), r.warnings)) {
            std::cerr << "Unknown code in monthly_values row, ignored" << std::endl;
        }
        r.is_closed = sqlite3_column_int(stmt, 18) != 0;
        r.closed_by = column_text(stmt, 19);
        r.closed_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 20));
        r.reopened_by = column_text(stmt, 21);
        r.reopened_at = static_cast<std::time_t>(sqlite3_column_int64(stmt, 22));
        result = r;
    }

    sqlite3_finalize(stmt);
    return result;
}

bool MonthlyValueDao::is_closed(const std::string& employee_id, int year, int month) {
    auto month_value = get(employee_id, year, month);
    return month_value && month_value->is_closed;
}

std::optional<core::TransitionStatus> MonthlyValueDao::close(const std::string& employee_id, int year, int month,
                                                             const std::string& actor, std::time_t at) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "UPDATE monthly_values SET is_closed = 1, closed_by = ?, closed_at = ? "
        "WHERE employee_id = ? AND year = ? AND month = ? AND is_closed = 0";
    int changed = set_closed_state(db, sql, employee_id, year, month, actor, at);
    if (changed < 0) return std::nullopt;
    if (changed > 0) return core::TransitionStatus::Ok;

    return get(employee_id, year, month) ? core::TransitionStatus::AlreadyClosed
                                         : core::TransitionStatus::OutOfRange;
}

std::optional<core::TransitionStatus> MonthlyValueDao::reopen(const std::string& employee_id, int year, int month,
                                                              const std::string& actor, std::time_t at) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "UPDATE monthly_values SET is_closed = 0, reopened_by = ?, reopened_at = ? "
        "WHERE employee_id = ? AND year = ? AND month = ? AND is_closed = 1";
    int changed = set_closed_state(db, sql, employee_id, year, month, actor, at);
    if (changed < 0) return std::nullopt;
    if (changed > 0) return core::TransitionStatus::Ok;

    return get(employee_id, year, month) ? core::TransitionStatus::NotClosed
                                         : core::TransitionStatus::OutOfRange;
}

} // namespace db
