/**
 * @file database_manager.h
 * @brief SQLite 连接管理 (单例)
 * @details 表结构: daily_values / daily_surcharges / monthly_values / account_ledger。
 *          月结、年结的检查都写成条件 UPDATE/INSERT, 调用方通过 changed_rows()
 *          判断条件写是否生效。测试时可以用 ":memory:" 打开。
 */

#ifndef DATABASE_MANAGER_H
#define DATABASE_MANAGER_H

#include <sqlite3.h>
#include <string>
#include <mutex>

namespace db {

class DatabaseManager {
public:
    static DatabaseManager& instance();

    ~DatabaseManager();

    // 打开数据库并建表, 已打开时直接返回 true
    bool open(const std::string& path);
    void close();

    bool execute(const std::string& sql);

    // begin 使用 IMMEDIATE, 先拿写锁再做 "读取 + 条件写入"
    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();

    // 上一条 INSERT/UPDATE/DELETE 实际影响的行数, 未连接时为 0
    int changed_rows() const { return db_ ? sqlite3_changes(db_) : 0; }

    sqlite3* connection() const { return db_; }
    bool is_open() const { return db_ != nullptr; }

private:
    DatabaseManager();
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool create_tables();

    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace db

#endif // DATABASE_MANAGER_H
