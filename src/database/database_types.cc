/**
 * @file database_types.cc
 * @brief 数据库字段转换
 */

#include "database/database_types.h"

#include <exception>

namespace db {

std::string to_db_date(const boost::gregorian::date& d) {
    return boost::gregorian::to_iso_extended_string(d);
}

std::optional<boost::gregorian::date> from_db_date(const std::string& text) {
    try {
        boost::gregorian::date d = boost::gregorian::from_simple_string(text);
        if (d.is_special()) return std::nullopt;
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace db
