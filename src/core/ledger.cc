/**
 * @file ledger.cc
 * @brief 账户台账实现
 */

#include "core/ledger.h"

#include "core/vacation.h"

namespace core {

Decimal available(const AccountLedgerEntry& entry) {
    if (entry.kind == AccountKind::Vacation) {
        return entry.yearly_entitlement + entry.opening_balance - entry.used;
    }
    return entry.current_balance;
}

Decimal closing_balance_for(const AccountLedgerEntry& entry, const YearEndCaps& caps) {
    switch (entry.kind) {
        case AccountKind::Vacation:
            return calculate_carryover(available(entry), caps.max_carryover);
        case AccountKind::Flextime: {
            Decimal balance = entry.current_balance;
            if (caps.positive_limit && balance > *caps.positive_limit) {
                balance = *caps.positive_limit;
            }
            if (caps.negative_limit && balance < -*caps.negative_limit) {
                balance = -*caps.negative_limit;
            }
            return balance;
        }
        case AccountKind::Overtime:
        case AccountKind::Surcharge:
            return entry.current_balance;
    }
    return entry.current_balance;
}

TransitionStatus close_year(AccountLedgerEntry& entry,
                            const YearEndCaps& caps,
                            std::optional<AccountLedgerEntry>& next) {
    if (entry.is_closed) return TransitionStatus::AlreadyClosed;
    if (next && next->is_closed) return TransitionStatus::AlreadyClosed;

    Decimal closing = closing_balance_for(entry, caps);
    entry.closing_balance = closing;
    entry.is_closed = true;

    if (!next) {
        AccountLedgerEntry fresh;
        fresh.employee_id = entry.employee_id;
        fresh.kind = entry.kind;
        fresh.year = entry.year + 1;
        next = fresh;
    }

    // 已有记录时保留本年已发生的变动, 只替换期初部分
    next->current_balance += closing - next->opening_balance;
    next->opening_balance = closing;
    return TransitionStatus::Ok;
}

TransitionStatus reopen_year(AccountLedgerEntry& entry) {
    if (!entry.is_closed) return TransitionStatus::NotClosed;

    entry.is_closed = false;
    entry.closing_balance.reset();
    return TransitionStatus::Ok;
}

} // namespace core
