/**
 * @file config.h
 * @brief 全局配置常量 - 集中管理所有可调参数
 *
 * 配置分类：
 * - [固定] 计算规则常量，不可通过配置文件修改
 * - [默认] 日计划/假期配置的默认值，运行时由 ConfigLoader 从 JSON 覆盖
 *
 * 使用方法：
 *   #include "config.h"
 *   int grace = Config::Policy::WINDOW_GRACE_MINUTES;   // 固定常量
 *   int hours = Config::Default::STANDARD_WEEKLY_HOURS; // 默认值
 */

#pragma once

namespace Config {

// ==================== 路径配置 [固定] ====================
namespace Path {
    constexpr const char* DATABASE = "./worktime.db";
    constexpr const char* PLANS = "./plans.json";
}

// ==================== 时间范围 [固定] ====================
namespace Time {
    constexpr int MINUTES_PER_DAY = 1440;          // 一天的分钟数, 时刻取值 [0, 1440)
    constexpr int DAY_END = 1440;                  // 窗口结束允许等于 1440 (24:00)
}

// ==================== 判定规则 [固定] ====================
namespace Policy {
    constexpr int WINDOW_GRACE_MINUTES = 30;       // 超出来/走窗口多少分钟算错误
    constexpr int LONG_WORK_DAY_MINUTES = 600;     // 毛工时超过该值给出警告
    constexpr int MAX_ALTERNATIVE_PLANS = 6;       // 班次识别最多 6 个备选日计划
    constexpr int MAX_MONTHS_PER_YEAR = 12;
}

// ==================== 默认值 [可配置] ====================
// 这些值仅作为 ConfigLoader 的初始默认值
namespace Default {
    constexpr int STANDARD_WEEKLY_HOURS = 40;      // 全职周工时
    constexpr int BASE_VACATION_DAYS = 30;         // 年假基数 (天)
    constexpr int HOLIDAY_CATEGORY = 1;            // 未给出类别的节假日按全天处理
    constexpr int HALF_HOLIDAY_DIVISOR = 2;        // 类别 2 节假日默认计入 1/2 目标时间
    constexpr const char* SYSTEM_ACTOR = "system";
}

} // namespace Config
