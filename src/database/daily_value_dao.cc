/**
 * @file daily_value_dao.cc
 * @brief 日值数据访问对象实现
 */

#include "database/daily_value_dao.h"
#include "database/database_manager.h"
#include "core/codes.h"
#include <cstdio>
#include <iostream>

namespace db {

namespace {

// 月结保护条件, 参数依次为 employee_id, year, month
const char* MONTH_OPEN_GUARD =
    "NOT EXISTS (SELECT 1 FROM monthly_values WHERE employee_id = ? AND year = ? AND month = ? AND is_closed = 1)";

const char* SELECT_COLUMNS =
    "SELECT value_date, plan_code, day_kind, gross_minutes, net_minutes, target_minutes, overtime_minutes, "
    "undertime_minutes, break_minutes, paid_break_minutes, capped_minutes, booking_count, first_come, last_go, "
    "absence_kind, absence_fraction_raw, error_codes, warning_codes FROM daily_values ";

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::optional<int> column_optional_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt, col);
}

void bind_optional_int(sqlite3_stmt* stmt, int idx, const std::optional<int>& v) {
    if (v) {
        sqlite3_bind_int(stmt, idx, *v);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

core::DailyResult read_row(sqlite3_stmt* stmt) {
    core::DailyResult r;
    r.plan_code = column_text(stmt, 1);
    r.kind = core::parse_day_kind(column_text(stmt, 2)).value_or(core::DayKind::Normal);
    r.gross_minutes = sqlite3_column_int(stmt, 3);
    r.net_minutes = sqlite3_column_int(stmt, 4);
    r.target_minutes = sqlite3_column_int(stmt, 5);
    r.overtime_minutes = sqlite3_column_int(stmt, 6);
    r.undertime_minutes = sqlite3_column_int(stmt, 7);
    r.break_minutes = sqlite3_column_int(stmt, 8);
    r.paid_break_minutes = sqlite3_column_int(stmt, 9);
    r.capped_minutes = sqlite3_column_int(stmt, 10);
    r.booking_count = sqlite3_column_int(stmt, 11);
    r.first_come = column_optional_int(stmt, 12);
    r.last_go = column_optional_int(stmt, 13);
    if (sqlite3_column_type(stmt, 14) != SQLITE_NULL) {
        r.absence_kind = core::parse_absence_kind(column_text(stmt, 14));
    }
    r.absence_fraction = core::Decimal::from_raw(sqlite3_column_int64(stmt, 15));
    if (!core::split_codes(column_text(stmt, 16), r.errors) ||
        !core::split_codes(column_text(stmt, 17), r.warnings)) {
        std::cerr << "Unknown code in daily_values row, ignored" << std::endl;
    }
    return r;
}

bool load_surcharges(sqlite3* db, const std::string& employee_id, const std::string& date,
                     core::DailyResult& result) {
    const char* sql = "SELECT account, minutes FROM daily_surcharges WHERE employee_id = ? AND value_date = ? ORDER BY account";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, date.c_str(), -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.surcharges.push_back({column_text(stmt, 0), sqlite3_column_int(stmt, 1)});
    }

    sqlite3_finalize(stmt);
    return true;
}

bool replace_surcharges(sqlite3* db, const std::string& employee_id, const std::string& date,
                        const std::vector<core::SurchargeResult>& surcharges) {
    sqlite3_stmt* stmt;
    const char* sql_delete = "DELETE FROM daily_surcharges WHERE employee_id = ? AND value_date = ?";
    if (sqlite3_prepare_v2(db, sql_delete, -1, &stmt, nullptr) != SQLITE_OK) return false;
    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, date.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    if (!ok) return false;

    // 同一账户可能来自多条规则, 按账户累加
    const char* sql_insert =
        "INSERT INTO daily_surcharges (employee_id, value_date, account, minutes) VALUES (?, ?, ?, ?) "
        "ON CONFLICT(employee_id, value_date, account) DO UPDATE SET minutes = minutes + excluded.minutes";
    for (const auto& s : surcharges) {
        if (sqlite3_prepare_v2(db, sql_insert, -1, &stmt, nullptr) != SQLITE_OK) return false;
        sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, s.account.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 4, s.minutes);
        ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_finalize(stmt);
        if (!ok) return false;
    }
    return true;
}

} // namespace

WriteStatus DailyValueDao::upsert(const std::string& employee_id,
                                  const boost::gregorian::date& date,
                                  const core::DailyResult& result) {
    DatabaseManager& manager = DatabaseManager::instance();
    sqlite3* db = manager.connection();
    if (!db) return WriteStatus::Failed;

    const std::string sql = std::string(
        "INSERT INTO daily_values (employee_id, value_date, plan_code, day_kind, gross_minutes, net_minutes, "
        "target_minutes, overtime_minutes, undertime_minutes, break_minutes, paid_break_minutes, capped_minutes, "
        "booking_count, first_come, last_go, absence_kind, absence_fraction_raw, error_codes, warning_codes, has_error) "
        "SELECT ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ? WHERE ") + MONTH_OPEN_GUARD +
        " ON CONFLICT(employee_id, value_date) DO UPDATE SET "
        "plan_code = excluded.plan_code, day_kind = excluded.day_kind, gross_minutes = excluded.gross_minutes, "
        "net_minutes = excluded.net_minutes, target_minutes = excluded.target_minutes, "
        "overtime_minutes = excluded.overtime_minutes, undertime_minutes = excluded.undertime_minutes, "
        "break_minutes = excluded.break_minutes, paid_break_minutes = excluded.paid_break_minutes, "
        "capped_minutes = excluded.capped_minutes, booking_count = excluded.booking_count, "
        "first_come = excluded.first_come, last_go = excluded.last_go, absence_kind = excluded.absence_kind, "
        "absence_fraction_raw = excluded.absence_fraction_raw, error_codes = excluded.error_codes, "
        "warning_codes = excluded.warning_codes, has_error = excluded.has_error";

    const std::string date_text = to_db_date(date);
    const std::string errors = core::join_codes(result.errors);
    const std::string warnings = core::join_codes(result.warnings);

    if (!manager.begin_transaction()) return WriteStatus::Failed;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        manager.rollback_transaction();
        return WriteStatus::Failed;
    }

    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, date_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, result.plan_code.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, core::to_string(result.kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 5, result.gross_minutes);
    sqlite3_bind_int(stmt, 6, result.net_minutes);
    sqlite3_bind_int(stmt, 7, result.target_minutes);
    sqlite3_bind_int(stmt, 8, result.overtime_minutes);
    sqlite3_bind_int(stmt, 9, result.undertime_minutes);
    sqlite3_bind_int(stmt, 10, result.break_minutes);
    sqlite3_bind_int(stmt, 11, result.paid_break_minutes);
    sqlite3_bind_int(stmt, 12, result.capped_minutes);
    sqlite3_bind_int(stmt, 13, result.booking_count);
    bind_optional_int(stmt, 14, result.first_come);
    bind_optional_int(stmt, 15, result.last_go);
    if (result.absence_kind) {
        sqlite3_bind_text(stmt, 16, core::to_string(*result.absence_kind), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 16);
    }
    sqlite3_bind_int64(stmt, 17, result.absence_fraction.raw());
    sqlite3_bind_text(stmt, 18, errors.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 19, warnings.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 20, result.has_error() ? 1 : 0);
    sqlite3_bind_text(stmt, 21, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 22, date.year());
    sqlite3_bind_int(stmt, 23, date.month());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        std::cerr << "Upsert daily value failed: " << sqlite3_errmsg(db) << std::endl;
        manager.rollback_transaction();
        return WriteStatus::Failed;
    }
    if (manager.changed_rows() == 0) {
        manager.rollback_transaction();
        return WriteStatus::Rejected;
    }
    if (!replace_surcharges(db, employee_id, date_text, result.surcharges)) {
        std::cerr << "Store surcharges failed: " << sqlite3_errmsg(db) << std::endl;
        manager.rollback_transaction();
        return WriteStatus::Failed;
    }

    return manager.commit_transaction() ? WriteStatus::Written : WriteStatus::Failed;
}

WriteStatus DailyValueDao::remove(const std::string& employee_id, const boost::gregorian::date& date) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return WriteStatus::Failed;

    // 月已结时不删除: 先查保护条件, 同一条语句里再删
    const std::string sql = std::string(
        "DELETE FROM daily_values WHERE employee_id = ? AND value_date = ? AND ") + MONTH_OPEN_GUARD;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return WriteStatus::Failed;
    }

    const std::string date_text = to_db_date(date);
    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, date_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, date.year());
    sqlite3_bind_int(stmt, 5, date.month());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Delete daily value failed: " << sqlite3_errmsg(db) << std::endl;
        return WriteStatus::Failed;
    }
    if (DatabaseManager::instance().changed_rows() > 0) return WriteStatus::Written;

    // 没有删除任何行: 区分 "本来就没有" 和 "月已结"
    return get(employee_id, date) ? WriteStatus::Rejected : WriteStatus::Written;
}

std::optional<core::DailyResult> DailyValueDao::get(const std::string& employee_id,
                                                    const boost::gregorian::date& date) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const std::string sql = std::string(SELECT_COLUMNS) + "WHERE employee_id = ? AND value_date = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    const std::string date_text = to_db_date(date);
    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, date_text.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<core::DailyResult> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = read_row(stmt);
    }
    sqlite3_finalize(stmt);

    if (result && !load_surcharges(db, employee_id, date_text, *result)) {
        std::cerr << "Load surcharges failed: " << sqlite3_errmsg(db) << std::endl;
    }
    return result;
}

std::vector<std::pair<boost::gregorian::date, core::DailyResult>>
DailyValueDao::get_month(const std::string& employee_id, int year, int month) {
    std::vector<std::pair<boost::gregorian::date, core::DailyResult>> values;
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return values;

    // value_date 为 YYYY-MM-DD, 按前缀筛选
    const std::string sql = std::string(SELECT_COLUMNS) +
                            "WHERE employee_id = ? AND substr(value_date, 1, 7) = ? ORDER BY value_date ASC";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return values;

    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%04d-%02d", year, month);
    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, prefix, -1, SQLITE_TRANSIENT);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto date = from_db_date(column_text(stmt, 0));
        if (!date) continue;
        values.emplace_back(*date, read_row(stmt));
    }
    sqlite3_finalize(stmt);

    for (auto& v : values) {
        if (!load_surcharges(db, employee_id, to_db_date(v.first), v.second)) {
            std::cerr << "Load surcharges failed: " << sqlite3_errmsg(db) << std::endl;
        }
    }
    return values;
}

} // namespace db
