#ifndef DATABASE_TYPES_H
#define DATABASE_TYPES_H

#include <optional>
#include <string>

#include <boost/date_time/gregorian/gregorian.hpp>

namespace db {

/**
 * @brief 受保护写入的结果
 * Rejected 表示目标月份/年度已结, 条件写没有生效
 */
enum class WriteStatus {
    Written,
    Rejected,
    Failed
};

// 日期与数据库文本 (YYYY-MM-DD) 互转, 解析失败返回 std::nullopt
std::string to_db_date(const boost::gregorian::date& d);
std::optional<boost::gregorian::date> from_db_date(const std::string& text);

} // namespace db

#endif // DATABASE_TYPES_H
