/**
 * @file database_manager.cc
 * @brief 数据库连接管理实现
 * @details 负责 SQLite 数据库的打开、关闭、事务处理以及日值/月值/账户台账表结构的自动创建。
 */

#include "database/database_manager.h"
#include <iostream>

namespace db {

DatabaseManager& DatabaseManager::instance() {
    static DatabaseManager instance;
    return instance;
}

DatabaseManager::DatabaseManager() {}

DatabaseManager::~DatabaseManager() {
    close();
}

bool DatabaseManager::open(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            return true; // 已经打开
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc) {
            std::cerr << "Can't open database: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
    }

    // 开启外键约束支持
    execute("PRAGMA foreign_keys = ON;");

    // 创建表结构
    if (!create_tables()) {
        close();
        return false;
    }

    return true;
}

void DatabaseManager::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool DatabaseManager::execute(const std::string& sql) {
    if (!db_) return false;

    char* zErrMsg = 0;
    int rc = sqlite3_exec(db_, sql.c_str(), 0, 0, &zErrMsg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (zErrMsg ? zErrMsg : sqlite3_errmsg(db_)) << "\nSQL: " << sql << std::endl;
        sqlite3_free(zErrMsg);
        return false;
    }
    return true;
}

bool DatabaseManager::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

bool DatabaseManager::commit_transaction() {
    return execute("COMMIT;");
}

bool DatabaseManager::rollback_transaction() {
    return execute("ROLLBACK;");
}

bool DatabaseManager::create_tables() {
    // 金额类字段 (*_raw) 保存 core::Decimal 的定点原始值
    const char* sql_daily =
        "CREATE TABLE IF NOT EXISTS daily_values ("
        "employee_id TEXT NOT NULL,"
        "value_date TEXT NOT NULL,"
        "plan_code TEXT,"
        "day_kind TEXT NOT NULL,"
        "gross_minutes INTEGER DEFAULT 0,"
        "net_minutes INTEGER DEFAULT 0,"
        "target_minutes INTEGER DEFAULT 0,"
        "overtime_minutes INTEGER DEFAULT 0,"
        "undertime_minutes INTEGER DEFAULT 0,"
        "break_minutes INTEGER DEFAULT 0,"
        "paid_break_minutes INTEGER DEFAULT 0,"
        "capped_minutes INTEGER DEFAULT 0,"
        "booking_count INTEGER DEFAULT 0,"
        "first_come INTEGER,"
        "last_go INTEGER,"
        "absence_kind TEXT,"
        "absence_fraction_raw INTEGER DEFAULT 0,"
        "error_codes TEXT,"
        "warning_codes TEXT,"
        "has_error INTEGER DEFAULT 0,"
        "PRIMARY KEY(employee_id, value_date)"
        ");";

    const char* sql_surcharges =
        "CREATE TABLE IF NOT EXISTS daily_surcharges ("
        "employee_id TEXT NOT NULL,"
        "value_date TEXT NOT NULL,"
        "account TEXT NOT NULL,"
        "minutes INTEGER NOT NULL,"
        "PRIMARY KEY(employee_id, value_date, account),"
        "FOREIGN KEY(employee_id, value_date) REFERENCES daily_values(employee_id, value_date) ON DELETE CASCADE"
        ");";

    const char* sql_monthly =
        "CREATE TABLE IF NOT EXISTS monthly_values ("
        "employee_id TEXT NOT NULL,"
        "year INTEGER NOT NULL,"
        "month INTEGER NOT NULL,"
        "gross_minutes INTEGER DEFAULT 0,"
        "net_minutes INTEGER DEFAULT 0,"
        "target_minutes INTEGER DEFAULT 0,"
        "overtime_minutes INTEGER DEFAULT 0,"
        "undertime_minutes INTEGER DEFAULT 0,"
        "break_minutes INTEGER DEFAULT 0,"
        "flextime_start INTEGER DEFAULT 0,"
        "flextime_change INTEGER DEFAULT 0,"
        "flextime_raw INTEGER DEFAULT 0,"
        "flextime_credited INTEGER DEFAULT 0,"
        "flextime_forfeited INTEGER DEFAULT 0,"
        "flextime_end INTEGER DEFAULT 0,"
        "work_days INTEGER DEFAULT 0,"
        "error_days INTEGER DEFAULT 0,"
        "vacation_days_raw INTEGER DEFAULT 0,"
        "sick_days_raw INTEGER DEFAULT 0,"
        "other_absence_days_raw INTEGER DEFAULT 0,"
        "warning_codes TEXT,"
        "is_closed INTEGER DEFAULT 0,"
        "closed_by TEXT,"
        "closed_at INTEGER,"
        "reopened_by TEXT,"
        "reopened_at INTEGER,"
        "PRIMARY KEY(employee_id, year, month)"
        ");";

    const char* sql_ledger =
        "CREATE TABLE IF NOT EXISTS account_ledger ("
        "employee_id TEXT NOT NULL,"
        "account_kind TEXT NOT NULL,"
        "year INTEGER NOT NULL,"
        "opening_raw INTEGER DEFAULT 0,"
        "current_raw INTEGER DEFAULT 0,"
        "closing_raw INTEGER,"
        "entitlement_raw INTEGER DEFAULT 0,"
        "used_raw INTEGER DEFAULT 0,"
        "is_closed INTEGER DEFAULT 0,"
        "PRIMARY KEY(employee_id, account_kind, year)"
        ");";

    // 索引
    const char* sql_idx_daily = "CREATE INDEX IF NOT EXISTS idx_daily_date ON daily_values(value_date);";
    const char* sql_idx_monthly = "CREATE INDEX IF NOT EXISTS idx_monthly_closed ON monthly_values(is_closed);";

    return execute(sql_daily) &&
           execute(sql_surcharges) &&
           execute(sql_monthly) &&
           execute(sql_ledger) &&
           execute(sql_idx_daily) &&
           execute(sql_idx_monthly);
}

} // namespace db
