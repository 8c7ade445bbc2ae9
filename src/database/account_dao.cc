/**
 * @file account_dao.cc
 * @brief 账户台账数据访问对象实现
 */

#include "database/account_dao.h"
#include "database/database_manager.h"
#include "core/codes.h"
#include <iostream>

namespace db {

namespace {

// 写入一条台账, 覆盖 closing/is_closed; guard_open 为 true 时已结记录不覆盖
// 返回受影响行数, 出错返回 -1
int write_entry(sqlite3* db, const core::AccountLedgerEntry& e, bool guard_open) {
    std::string sql =
        "INSERT INTO account_ledger (employee_id, account_kind, year, opening_raw, current_raw, closing_raw, "
        "entitlement_raw, used_raw, is_closed) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(employee_id, account_kind, year) DO UPDATE SET "
        "opening_raw = excluded.opening_raw, current_raw = excluded.current_raw, "
        "entitlement_raw = excluded.entitlement_raw, used_raw = excluded.used_raw";
    if (guard_open) {
        sql += " WHERE account_ledger.is_closed = 0";
    } else {
        sql += ", closing_raw = excluded.closing_raw, is_closed = excluded.is_closed";
    }

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }

    sqlite3_bind_text(stmt, 1, e.employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, core::to_string(e.kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, e.year);
    sqlite3_bind_int64(stmt, 4, e.opening_balance.raw());
    sqlite3_bind_int64(stmt, 5, e.current_balance.raw());
    if (e.closing_balance) {
        sqlite3_bind_int64(stmt, 6, e.closing_balance->raw());
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_int64(stmt, 7, e.yearly_entitlement.raw());
    sqlite3_bind_int64(stmt, 8, e.used.raw());
    sqlite3_bind_int(stmt, 9, e.is_closed ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Write ledger entry failed: " << sqlite3_errmsg(db) << std::endl;
        return -1;
    }
    return DatabaseManager::instance().changed_rows();
}

} // namespace

WriteStatus AccountDao::upsert(const core::AccountLedgerEntry& entry) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return WriteStatus::Failed;

    core::AccountLedgerEntry open_entry = entry;
    open_entry.is_closed = false;
    open_entry.closing_balance.reset();

    int changed = write_entry(db, open_entry, true);
    if (changed < 0) return WriteStatus::Failed;
    return changed > 0 ? WriteStatus::Written : WriteStatus::Rejected;
}

std::optional<core::AccountLedgerEntry> AccountDao::get(const std::string& employee_id,
                                                        core::AccountKind kind, int year) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "SELECT opening_raw, current_raw, closing_raw, entitlement_raw, used_raw, is_closed "
        "FROM account_ledger WHERE employee_id = ? AND account_kind = ? AND year = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return std::nullopt;

    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, core::to_string(kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, year);

    std::optional<core::AccountLedgerEntry> result = std::nullopt;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        core::AccountLedgerEntry e;
        e.employee_id = employee_id;
        e.kind = kind;
        e.year = year;
        e.opening_balance = core::Decimal::from_raw(sqlite3_column_int64(stmt, 0));
        e.current_balance = core::Decimal::from_raw(sqlite3_column_int64(stmt, 1));
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
            e.closing_balance = core::Decimal::from_raw(sqlite3_column_int64(stmt, 2));
        }
        e.yearly_entitlement = core::Decimal::from_raw(sqlite3_column_int64(stmt, 3));
        e.used = core::Decimal::from_raw(sqlite3_column_int64(stmt, 4));
        e.is_closed = sqlite3_column_int(stmt, 5) != 0;
        result = e;
    }

    sqlite3_finalize(stmt);
    return result;
}

std::optional<core::TransitionStatus> AccountDao::close_year(const std::string& employee_id,
                                                             core::AccountKind kind, int year,
                                                             const core::YearEndCaps& caps) {
    DatabaseManager& manager = DatabaseManager::instance();
    sqlite3* db = manager.connection();
    if (!db) return std::nullopt;

    // IMMEDIATE 事务: 读取与写入之间不会有其他写者
    if (!manager.begin_transaction()) return std::nullopt;

    auto entry = get(employee_id, kind, year);
    if (!entry) {
        manager.rollback_transaction();
        return core::TransitionStatus::OutOfRange;
    }
    auto next = get(employee_id, kind, year + 1);

    core::TransitionStatus status = core::close_year(*entry, caps, next);
    if (status != core::TransitionStatus::Ok) {
        manager.rollback_transaction();
        return status;
    }

    if (write_entry(db, *entry, false) < 0 || write_entry(db, *next, false) < 0) {
        manager.rollback_transaction();
        return std::nullopt;
    }

    if (!manager.commit_transaction()) {
        manager.rollback_transaction();
        return std::nullopt;
    }
    return core::TransitionStatus::Ok;
}

std::optional<core::TransitionStatus> AccountDao::reopen_year(const std::string& employee_id,
                                                              core::AccountKind kind, int year) {
    sqlite3* db = DatabaseManager::instance().connection();
    if (!db) return std::nullopt;

    const char* sql =
        "UPDATE account_ledger SET is_closed = 0, closing_raw = NULL "
        "WHERE employee_id = ? AND account_kind = ? AND year = ? AND is_closed = 1";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "Prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, employee_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, core::to_string(kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 3, year);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "Reopen year failed: " << sqlite3_errmsg(db) << std::endl;
        return std::nullopt;
    }
    if (DatabaseManager::instance().changed_rows() > 0) return core::TransitionStatus::Ok;

    return get(employee_id, kind, year) ? core::TransitionStatus::NotClosed
                                        : core::TransitionStatus::OutOfRange;
}

} // namespace db
