/**
 * @file config_loader.cc
 * @brief JSON 配置加载实现 (Qt Core)
 */

#include "service/config_loader.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include "core/codes.h"
#include "core/surcharge.h"
#include "core/validation.h"
#include "service/time_tracking_service.h"

namespace service {

namespace {

// 时刻: "HH:MM" 或整数分钟; 缺省返回 nullopt, 格式错误置 ok = false
std::optional<int> read_clock(const QJsonObject& obj, const char* key, bool& ok) {
    QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (v.isDouble()) return v.toInt();
    if (v.isString()) {
        auto minutes = core::parse_clock(v.toString().toStdString());
        if (minutes) return minutes;
    }
    ok = false;
    return std::nullopt;
}

std::optional<int> read_int(const QJsonObject& obj, const char* key, bool& ok) {
    QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;
    if (v.isDouble()) return v.toInt();
    ok = false;
    return std::nullopt;
}

std::optional<core::Decimal> read_decimal(const QJsonObject& obj, const char* key, bool& ok) {
    QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull()) return std::nullopt;

    std::optional<core::Decimal> d;
    if (v.isString()) {
        d = core::Decimal::parse(v.toString().toStdString());
    } else if (v.isDouble()) {
        d = core::Decimal::parse(QString::number(v.toDouble(), 'f', core::Decimal::DIGITS).toStdString());
    }
    if (!d) ok = false;
    return d;
}

std::string read_string(const QJsonObject& obj, const char* key, const std::string& fallback = "") {
    QJsonValue v = obj.value(QLatin1String(key));
    return v.isString() ? v.toString().toStdString() : fallback;
}

core::RoundingRule read_rounding(const QJsonObject& obj, bool& ok) {
    core::RoundingRule rule;
    if (obj.isEmpty()) return rule;

    auto mode = core::parse_rounding_mode(read_string(obj, "mode", "none"));
    if (!mode) ok = false;
    rule.mode = mode.value_or(core::RoundingMode::None);
    rule.interval = read_int(obj, "interval", ok).value_or(0);
    rule.offset = read_int(obj, "offset", ok).value_or(0);
    return rule;
}

} // namespace

void ConfigLoader::fail(const std::string& message) {
    qWarning() << "Config:" << QString::fromStdString(message);
    errors_.push_back(message);
}

bool ConfigLoader::load_file(const std::string& path) {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        config_ = LoadedConfig();
        errors_.clear();
        fail("cannot open " + path + ": " + file.errorString().toStdString());
        return false;
    }
    return load_json(file.readAll());
}

bool ConfigLoader::load_json(const QByteArray& data) {
    config_ = LoadedConfig();
    errors_.clear();

    QJsonParseError parse_error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        fail("invalid JSON: " + parse_error.errorString().toStdString());
        return false;
    }
    QJsonObject root = doc.object();

    for (const QJsonValue& v : root.value("plans").toArray()) {
        auto plan = parse_plan(v.toObject());
        if (plan) config_.plans.push_back(*plan);
    }

    if (root.contains("monthly_evaluation")) {
        parse_evaluation(root.value("monthly_evaluation").toObject());
    }
    if (root.contains("year_end_caps")) {
        parse_year_end_caps(root.value("year_end_caps").toObject());
    }

    if (!errors_.empty()) {
        config_ = LoadedConfig();
        return false;
    }

    qDebug() << "Config: loaded" << config_.plans.size() << "day plans";
    return true;
}

std::optional<core::ScheduleConfig> ConfigLoader::parse_plan(const QJsonObject& obj) {
    core::ScheduleConfig plan;
    bool ok = true;

    plan.code = read_string(obj, "code");
    plan.name = read_string(obj, "name", plan.code);
    const std::string where = "plan '" + plan.code + "': ";

    auto kind = core::parse_plan_kind(read_string(obj, "kind", "fixed"));
    if (!kind) {
        fail(where + "unknown kind");
        return std::nullopt;
    }
    plan.kind = *kind;
    plan.target_minutes = read_int(obj, "target_minutes", ok).value_or(0);

    plan.come_from = read_clock(obj, "come_from", ok);
    plan.come_to = read_clock(obj, "come_to", ok);
    plan.go_from = read_clock(obj, "go_from", ok);
    plan.go_to = read_clock(obj, "go_to", ok);
    plan.core_start = read_clock(obj, "core_start", ok);
    plan.core_end = read_clock(obj, "core_end", ok);

    QJsonObject tol = obj.value("tolerance").toObject();
    plan.tolerance.come_plus = read_int(tol, "come_plus", ok).value_or(0);
    plan.tolerance.come_minus = read_int(tol, "come_minus", ok).value_or(0);
    plan.tolerance.go_plus = read_int(tol, "go_plus", ok).value_or(0);
    plan.tolerance.go_minus = read_int(tol, "go_minus", ok).value_or(0);

    plan.rounding_come = read_rounding(obj.value("rounding_come").toObject(), ok);
    plan.rounding_go = read_rounding(obj.value("rounding_go").toObject(), ok);
    plan.round_all_bookings = obj.value("round_all_bookings").toBool(false);
    plan.cap_to_window = obj.value("cap_to_window").toBool(false);

    plan.min_net_work_time = read_int(obj, "min_net_work_time", ok);
    plan.max_net_work_time = read_int(obj, "max_net_work_time", ok);

    QJsonObject credit = obj.value("holiday_credit").toObject();
    for (auto it = credit.begin(); it != credit.end(); ++it) {
        bool key_ok = false;
        int category = it.key().toInt(&key_ok);
        if (!key_ok || !it.value().isDouble()) {
            ok = false;
            continue;
        }
        plan.holiday_credit[category] = it.value().toInt();
    }
    plan.holiday_priority = read_int(obj, "holiday_priority", ok).value_or(0);

    auto policy = core::parse_no_booking_policy(read_string(obj, "no_booking_policy", "error"));
    if (!policy) {
        fail(where + "unknown no_booking_policy");
        return std::nullopt;
    }
    plan.no_booking_policy = *policy;
    if (obj.contains("no_booking_absence")) {
        plan.no_booking_absence = parse_absence(obj.value("no_booking_absence").toObject(), where);
        if (!plan.no_booking_absence) return std::nullopt;
    }

    for (const QJsonValue& v : obj.value("breaks").toArray()) {
        auto rule = parse_break(v.toObject(), where);
        if (!rule) return std::nullopt;
        plan.breaks.push_back(*rule);
    }

    QJsonObject detect = obj.value("shift_detection").toObject();
    plan.detect_arrive_from = read_clock(detect, "arrive_from", ok);
    plan.detect_arrive_to = read_clock(detect, "arrive_to", ok);
    plan.detect_depart_from = read_clock(detect, "depart_from", ok);
    plan.detect_depart_to = read_clock(detect, "depart_to", ok);
    for (const QJsonValue& v : detect.value("alternatives").toArray()) {
        plan.alternative_plans.push_back(v.toString().toStdString());
    }

    if (!parse_surcharges(obj, plan)) return std::nullopt;

    if (!ok) {
        fail(where + "malformed time or number field");
        return std::nullopt;
    }

    std::vector<std::string> problems = core::validate_schedule(plan);
    for (const auto& p : problems) {
        fail(where + p);
    }
    if (!problems.empty()) return std::nullopt;
    return plan;
}

std::optional<core::BreakRule> ConfigLoader::parse_break(const QJsonObject& obj, const std::string& where) {
    core::BreakRule rule;
    bool ok = true;

    auto kind = core::parse_break_kind(read_string(obj, "kind"));
    if (!kind) {
        fail(where + "unknown break kind");
        return std::nullopt;
    }
    rule.kind = *kind;
    rule.start = read_clock(obj, "start", ok);
    rule.end = read_clock(obj, "end", ok);
    rule.duration = read_int(obj, "duration", ok).value_or(0);
    rule.after_work_minutes = read_int(obj, "after_work_minutes", ok);
    rule.auto_deduct = obj.value("auto_deduct").toBool(false);
    rule.paid = obj.value("paid").toBool(false);
    rule.proportional = obj.value("proportional").toBool(false);

    if (!ok) {
        fail(where + "malformed break rule");
        return std::nullopt;
    }
    return rule;
}

std::optional<core::AbsenceFact> ConfigLoader::parse_absence(const QJsonObject& obj, const std::string& where) {
    core::AbsenceFact absence;
    bool ok = true;

    absence.type_code = read_string(obj, "type_code");
    auto kind = core::parse_absence_kind(read_string(obj, "kind", "other"));
    if (!kind) {
        fail(where + "unknown absence kind");
        return std::nullopt;
    }
    absence.kind = *kind;
    absence.credits_hours = obj.value("credits_hours").toBool(true);
    absence.duration_fraction = read_decimal(obj, "duration_fraction", ok).value_or(core::Decimal::from_int(1));
    absence.portion = read_decimal(obj, "portion", ok).value_or(core::Decimal::from_int(1));
    absence.priority = read_int(obj, "priority", ok).value_or(0);

    if (!ok) {
        fail(where + "malformed absence");
        return std::nullopt;
    }
    return absence;
}

bool ConfigLoader::parse_surcharges(const QJsonObject& obj, core::ScheduleConfig& plan) {
    const std::string where = "plan '" + plan.code + "': ";

    for (const QJsonValue& v : obj.value("surcharges").toArray()) {
        QJsonObject s = v.toObject();
        bool ok = true;

        core::SurchargeRule rule;
        rule.account = read_string(s, "account");
        rule.time_from = read_clock(s, "from", ok).value_or(-1);
        rule.time_to = read_clock(s, "to", ok).value_or(-1);
        rule.applies_on_workday = s.value("workday").toBool(true);
        rule.applies_on_holiday = s.value("holiday").toBool(false);
        for (const QJsonValue& c : s.value("holiday_categories").toArray()) {
            rule.holiday_categories.push_back(c.toInt());
        }
        if (!ok) {
            fail(where + "malformed surcharge window");
            return false;
        }

        // 显式声明跨午夜的窗口才自动拆分, 否则交给校验拒绝
        if (s.value("split_at_midnight").toBool(false)) {
            for (const auto& part : core::split_overnight_surcharge(rule)) {
                plan.surcharges.push_back(part);
            }
        } else {
            plan.surcharges.push_back(rule);
        }
    }
    return true;
}

bool ConfigLoader::parse_evaluation(const QJsonObject& obj) {
    core::MonthlyEvaluation rules;
    bool ok = true;

    auto type = core::parse_credit_type(read_string(obj, "credit_type", "no_evaluation"));
    if (!type) {
        fail("monthly_evaluation: unknown credit_type");
        return false;
    }
    rules.credit_type = *type;
    rules.flextime_threshold = read_int(obj, "flextime_threshold", ok);
    rules.max_flextime_per_month = read_int(obj, "max_flextime_per_month", ok);
    rules.flextime_cap_positive = read_int(obj, "flextime_cap_positive", ok);
    rules.flextime_cap_negative = read_int(obj, "flextime_cap_negative", ok);
    rules.annual_floor_balance = read_int(obj, "annual_floor_balance", ok);

    if (!ok) {
        fail("monthly_evaluation: malformed number");
        return false;
    }
    config_.evaluation = rules;
    return true;
}

bool ConfigLoader::parse_year_end_caps(const QJsonObject& obj) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        auto kind = core::parse_account_kind(it.key().toStdString());
        if (!kind) {
            fail("year_end_caps: unknown account kind " + it.key().toStdString());
            return false;
        }

        QJsonObject c = it.value().toObject();
        bool ok = true;
        core::YearEndCaps caps;
        caps.positive_limit = read_decimal(c, "positive_limit", ok);
        caps.negative_limit = read_decimal(c, "negative_limit", ok);
        caps.max_carryover = read_decimal(c, "max_carryover", ok);
        if (!ok) {
            fail("year_end_caps: malformed number");
            return false;
        }
        config_.year_end_caps[*kind] = caps;
    }
    return true;
}

void ConfigLoader::apply(TimeTrackingService& service) const {
    for (const auto& plan : config_.plans) {
        service.register_plan(plan);
    }
    service.set_monthly_evaluation(config_.evaluation);
    for (const auto& kv : config_.year_end_caps) {
        service.set_year_end_caps(kv.first, kv.second);
    }
}

} // namespace service
