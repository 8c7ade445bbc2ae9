#include <gtest/gtest.h>

#include "core/surcharge.h"
#include "test_helpers.h"

using namespace core;
using namespace testing_helpers;

namespace {

SurchargeRule rule(const std::string& account, int from, int to) {
    SurchargeRule r;
    r.account = account;
    r.time_from = from;
    r.time_to = to;
    return r;
}

} // namespace

TEST(SurchargeTest, NightWindowOverlap) {
    auto results = calculate_surcharges({work(1200, 1380)}, {rule("NIGHT", 1320, 1440)}, false, std::nullopt);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].account, "NIGHT");
    EXPECT_EQ(results[0].minutes, 60);
}

TEST(SurchargeTest, SplitShiftSumsPairs) {
    auto results = calculate_surcharges({work(360, 420), work(1230, 1290)},
                                        {rule("EDGE", 0, 390), rule("LATE", 1260, 1440)},
                                        false, std::nullopt);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].minutes, 30);
    EXPECT_EQ(results[1].minutes, 30);
    EXPECT_EQ(total_surcharge_minutes(results), 60);
}

TEST(SurchargeTest, BreakPairsIgnored) {
    auto results = calculate_surcharges({rest(1320, 1400)}, {rule("NIGHT", 1320, 1440)}, false, std::nullopt);
    EXPECT_TRUE(results.empty());
}

TEST(SurchargeTest, ZeroMinutesOmitted) {
    auto results = calculate_surcharges({work(480, 1020)}, {rule("NIGHT", 1320, 1440)}, false, std::nullopt);
    EXPECT_TRUE(results.empty());
}

TEST(SurchargeTest, OvernightSplit) {
    auto parts = split_overnight_surcharge(rule("NIGHT", 1320, 360));
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].time_from, 1320);
    EXPECT_EQ(parts[0].time_to, 1440);
    EXPECT_EQ(parts[1].time_from, 0);
    EXPECT_EQ(parts[1].time_to, 360);
    for (const auto& p : parts) {
        EXPECT_TRUE(validate_surcharge_rule(p).empty());
    }

    EXPECT_EQ(split_overnight_surcharge(rule("DAY", 480, 600)).size(), 1u);
}

TEST(SurchargeTest, Validation) {
    EXPECT_TRUE(validate_surcharge_rule(rule("NIGHT", 1320, 1440)).empty());
    EXPECT_FALSE(validate_surcharge_rule(rule("", 0, 60)).empty());
    EXPECT_FALSE(validate_surcharge_rule(rule("NIGHT", 1320, 360)).empty());
    EXPECT_FALSE(validate_surcharge_rule(rule("NIGHT", 1440, 1440)).empty());
    EXPECT_FALSE(validate_surcharge_rule(rule("NIGHT", 0, 0)).empty());
}

TEST(SurchargeTest, WorkdayAndHolidayFilters) {
    SurchargeRule r = rule("HOL", 0, 1440);
    EXPECT_TRUE(surcharge_applies(r, false, std::nullopt));
    EXPECT_FALSE(surcharge_applies(r, true, 1));

    r.applies_on_workday = false;
    r.applies_on_holiday = true;
    EXPECT_FALSE(surcharge_applies(r, false, std::nullopt));
    EXPECT_TRUE(surcharge_applies(r, true, 2));
    EXPECT_TRUE(surcharge_applies(r, true, std::nullopt));

    r.holiday_categories = {1};
    EXPECT_TRUE(surcharge_applies(r, true, 1));
    EXPECT_FALSE(surcharge_applies(r, true, 2));
    EXPECT_FALSE(surcharge_applies(r, true, std::nullopt));
}
