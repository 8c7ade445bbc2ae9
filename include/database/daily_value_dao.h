#ifndef DAILY_VALUE_DAO_H
#define DAILY_VALUE_DAO_H

#include "database/database_types.h"
#include "core/time_types.h"
#include <string>
#include <utility>
#include <vector>
#include <optional>

namespace db {

/**
 * @brief 日值 (DailyResult) 的存取, 主键 (employee_id, value_date)
 * 写操作都带月结保护: 所在月份已结时条件写不生效, 返回 WriteStatus::Rejected。
 * 配对明细不落库, 附加时间结果保存在 daily_surcharges 表。
 */
class DailyValueDao {
public:
    WriteStatus upsert(const std::string& employee_id,
                       const boost::gregorian::date& date,
                       const core::DailyResult& result);

    // 删除某天的结果 (例如无打卡策略为 skip)
    WriteStatus remove(const std::string& employee_id, const boost::gregorian::date& date);

    std::optional<core::DailyResult> get(const std::string& employee_id,
                                         const boost::gregorian::date& date);

    // 一个月内的全部日值, 按日期升序
    std::vector<std::pair<boost::gregorian::date, core::DailyResult>>
    get_month(const std::string& employee_id, int year, int month);
};

} // namespace db

#endif // DAILY_VALUE_DAO_H
