#ifndef ACCOUNT_DAO_H
#define ACCOUNT_DAO_H

#include "database/database_types.h"
#include "core/ledger.h"
#include <string>
#include <optional>

namespace db {

/**
 * @brief 账户台账的存取, 主键 (employee_id, account_kind, year)
 */
class AccountDao {
public:
    // 已结年度不覆盖, 返回 Rejected; 不修改 is_closed 和 closing_balance
    WriteStatus upsert(const core::AccountLedgerEntry& entry);

    std::optional<core::AccountLedgerEntry> get(const std::string& employee_id,
                                                core::AccountKind kind, int year);

    /**
     * @brief 年结: 冻结本年台账并 upsert 下一年的期初余额, 在一个事务内完成
     * @return std::nullopt 表示数据库错误; 本年没有台账返回 OutOfRange
     */
    std::optional<core::TransitionStatus> close_year(const std::string& employee_id,
                                                     core::AccountKind kind, int year,
                                                     const core::YearEndCaps& caps);

    std::optional<core::TransitionStatus> reopen_year(const std::string& employee_id,
                                                      core::AccountKind kind, int year);
};

} // namespace db

#endif // ACCOUNT_DAO_H
