/**
 * @file ledger.h
 * @brief 账户台账 - 每个 (员工, 账户类型, 年) 一条, 年结时冻结并把余额结转到下一年
 * @details 余额统一用 Decimal: 弹性时间/加班/附加时间账户单位为分钟, 年假账户单位为天。
 */

#ifndef CORE_LEDGER_H
#define CORE_LEDGER_H

#include <optional>
#include <string>

#include "core/time_types.h"

namespace core {

struct AccountLedgerEntry {
    std::string employee_id;
    AccountKind kind = AccountKind::Flextime;
    int year = 0;
    Decimal opening_balance;
    Decimal current_balance;
    std::optional<Decimal> closing_balance;
    Decimal yearly_entitlement;    // 仅年假账户
    Decimal used;                  // 仅年假账户: 已休天数
    bool is_closed = false;
};

/**
 * @brief 年结上限, 未设置的不生效
 */
struct YearEndCaps {
    std::optional<Decimal> positive_limit;   // 弹性时间余额上限
    std::optional<Decimal> negative_limit;   // 弹性时间余额下限 (以正数保存)
    std::optional<Decimal> max_carryover;    // 年假最多结转天数
};

// 年假: entitlement + opening - used; 其它账户: current_balance
Decimal available(const AccountLedgerEntry& entry);

// 按账户类型计算结转余额 (不修改 entry)
Decimal closing_balance_for(const AccountLedgerEntry& entry, const YearEndCaps& caps);

/**
 * @brief 年结
 * @param next 下一年的台账: 有值时更新其期初余额 (current 同步调整), 无值时新建
 * @return entry 已结返回 AlreadyClosed; 下一年已结同样返回 AlreadyClosed, 两者都不做修改
 */
TransitionStatus close_year(AccountLedgerEntry& entry,
                            const YearEndCaps& caps,
                            std::optional<AccountLedgerEntry>& next);

// 重新打开已结年度, 清除 closing_balance; 未结返回 NotClosed
TransitionStatus reopen_year(AccountLedgerEntry& entry);

} // namespace core

#endif // CORE_LEDGER_H
