/**
 * @file config_loader.h
 * @brief JSON 配置加载 (日计划、月度入账规则、年结上限)
 * @details 时刻可以写成 "HH:MM" 字符串或分钟整数, 小数可以写成字符串或数字。
 *          所有日计划都经过 core::validate_schedule 校验, 有任何错误整份配置都不生效。
 */

#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QJsonObject>

#include "core/ledger.h"
#include "core/monthly.h"
#include "core/time_types.h"

namespace service {

class TimeTrackingService;

struct LoadedConfig {
    std::vector<core::ScheduleConfig> plans;
    std::optional<core::MonthlyEvaluation> evaluation;
    std::map<core::AccountKind, core::YearEndCaps> year_end_caps;
};

class ConfigLoader {
public:
    bool load_file(const std::string& path);
    bool load_json(const QByteArray& data);

    const LoadedConfig& config() const { return config_; }
    const std::vector<std::string>& errors() const { return errors_; }

    // 把已加载的配置注册到服务
    void apply(TimeTrackingService& service) const;

private:
    std::optional<core::ScheduleConfig> parse_plan(const QJsonObject& obj);
    std::optional<core::BreakRule> parse_break(const QJsonObject& obj, const std::string& where);
    std::optional<core::AbsenceFact> parse_absence(const QJsonObject& obj, const std::string& where);
    bool parse_surcharges(const QJsonObject& obj, core::ScheduleConfig& plan);
    bool parse_evaluation(const QJsonObject& obj);
    bool parse_year_end_caps(const QJsonObject& obj);

    void fail(const std::string& message);

    LoadedConfig config_;
    std::vector<std::string> errors_;
};

} // namespace service

#endif // CONFIG_LOADER_H
