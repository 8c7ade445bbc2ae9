#ifndef MONTHLY_VALUE_DAO_H
#define MONTHLY_VALUE_DAO_H

#include "database/database_types.h"
#include "core/monthly.h"
#include <ctime>
#include <string>
#include <optional>

namespace db {

/**
 * @brief 月值的存取, 主键 (employee_id, year, month)
 * 月结/反结使用 compare-and-set (WHERE is_closed = 0/1), 并发时只有一个能成功。
 */
class MonthlyValueDao {
public:
    // 已结月份不覆盖, 返回 Rejected; 不修改 is_closed 及结账人信息
    WriteStatus upsert(const std::string& employee_id, const core::MonthlyResult& result);

    std::optional<core::MonthlyResult> get(const std::string& employee_id, int year, int month);

    bool is_closed(const std::string& employee_id, int year, int month);

    // 返回 std::nullopt 表示数据库错误; 没有月值记录时返回 OutOfRange
    std::optional<core::TransitionStatus> close(const std::string& employee_id, int year, int month,
                                                const std::string& actor, std::time_t at);
    std::optional<core::TransitionStatus> reopen(const std::string& employee_id, int year, int month,
                                                 const std::string& actor, std::time_t at);
};

} // namespace db

#endif // MONTHLY_VALUE_DAO_H
