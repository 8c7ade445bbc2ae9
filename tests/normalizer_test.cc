#include <gtest/gtest.h>

#include "core/normalizer.h"
#include "test_helpers.h"

using namespace core;
using namespace testing_helpers;

TEST(NormalizerTest, RoundingModes) {
    EXPECT_EQ(apply_rounding(487, RoundingMode::Up, 15), 495);
    EXPECT_EQ(apply_rounding(487, RoundingMode::Down, 15), 480);
    EXPECT_EQ(apply_rounding(487, RoundingMode::Nearest, 15), 480);
    EXPECT_EQ(apply_rounding(488, RoundingMode::Nearest, 15), 495);
    EXPECT_EQ(apply_rounding(487, RoundingMode::None, 15), 487);
    EXPECT_EQ(apply_rounding(487, RoundingMode::Up, 0), 487);
    EXPECT_EQ(apply_rounding(495, RoundingMode::Up, 15), 495);
}

TEST(NormalizerTest, RoundingIsIdempotent) {
    for (auto mode : {RoundingMode::Up, RoundingMode::Down, RoundingMode::Nearest}) {
        for (int t = 0; t < 1440; t += 7) {
            int once = apply_rounding(t, mode, 15);
            EXPECT_EQ(apply_rounding(once, mode, 15), once);
        }
    }
}

TEST(NormalizerTest, OffsetAndClamp) {
    RoundingRule rule{RoundingMode::Up, 15, 5};
    EXPECT_EQ(apply_rounding(487, rule), 500);

    RoundingRule late{RoundingMode::Up, 15, 30};
    EXPECT_EQ(apply_rounding(1430, late), 1440);

    RoundingRule early{RoundingMode::Down, 15, -30};
    EXPECT_EQ(apply_rounding(10, early), 0);
}

TEST(NormalizerTest, ComeTolerance) {
    Tolerance tol;
    tol.come_minus = 5;
    tol.come_plus = 5;
    EXPECT_EQ(apply_come_tolerance(476, 480, tol), 480);
    EXPECT_EQ(apply_come_tolerance(485, 480, tol), 480);
    EXPECT_EQ(apply_come_tolerance(486, 480, tol), 486);
    EXPECT_EQ(apply_come_tolerance(474, 480, tol), 474);
    EXPECT_EQ(apply_come_tolerance(485, std::nullopt, tol), 485);
}

TEST(NormalizerTest, GoToleranceUsesWindowEnd) {
    Tolerance tol;
    tol.go_minus = 10;
    tol.go_plus = 10;
    EXPECT_EQ(apply_go_tolerance(1015, 960, 1020, tol), 1020);
    EXPECT_EQ(apply_go_tolerance(965, 960, 1020, tol), 965);
    EXPECT_EQ(apply_go_tolerance(965, 960, std::nullopt, tol), 960);
}

TEST(NormalizerTest, FirstAndLastBoundariesOnly) {
    ScheduleConfig plan = fixed_plan("DAY", 480);
    plan.rounding_come = {RoundingMode::Up, 15, 0};
    plan.rounding_go = {RoundingMode::Down, 15, 0};

    auto out = normalize_work_pairs({work(487, 720), work(787, 1027)}, plan);
    ASSERT_EQ(out.pairs.size(), 2u);
    EXPECT_EQ(out.pairs[0].start, 495);
    EXPECT_EQ(out.pairs[0].end, 720);
    EXPECT_EQ(out.pairs[1].start, 787);
    EXPECT_EQ(out.pairs[1].end, 1020);
    EXPECT_EQ(out.first_start, 495);
    EXPECT_EQ(out.last_end, 1020);
}

TEST(NormalizerTest, RoundAllBookings) {
    ScheduleConfig plan = fixed_plan("DAY", 480);
    plan.rounding_come = {RoundingMode::Up, 15, 0};
    plan.round_all_bookings = true;

    auto out = normalize_work_pairs({work(480, 720), work(787, 1020)}, plan);
    EXPECT_EQ(out.pairs[1].start, 795);
}

TEST(NormalizerTest, ToleranceBeforeRounding) {
    ScheduleConfig plan = fixed_plan("DAY", 480);
    plan.come_from = 480;
    plan.tolerance.come_plus = 5;
    plan.rounding_come = {RoundingMode::Up, 15, 0};

    auto out = normalize_work_pairs({work(484, 1020)}, plan);
    EXPECT_EQ(out.pairs[0].start, 480);

    out = normalize_work_pairs({work(486, 1020)}, plan);
    EXPECT_EQ(out.pairs[0].start, 495);
}

TEST(NormalizerTest, CapToWindow) {
    ScheduleConfig plan = fixed_plan("DAY", 480);
    plan.come_from = 480;
    plan.go_to = 1020;
    plan.cap_to_window = true;

    auto out = normalize_work_pairs({work(420, 1080)}, plan);
    EXPECT_EQ(out.pairs[0].start, 480);
    EXPECT_EQ(out.pairs[0].end, 1020);
    EXPECT_EQ(out.capped_minutes, 120);
    EXPECT_EQ(out.first_start, 420);
    EXPECT_EQ(out.last_end, 1080);

    plan.cap_to_window = false;
    out = normalize_work_pairs({work(420, 1080)}, plan);
    EXPECT_EQ(out.capped_minutes, 0);
    EXPECT_EQ(out.pairs[0].duration(), 660);
}

TEST(NormalizerTest, FlextimeWindowIncludesEarlyTolerance) {
    ScheduleConfig plan = fixed_plan("FLEX", 480);
    plan.kind = PlanKind::Flextime;
    plan.come_from = 420;
    plan.tolerance.come_minus = 30;
    plan.cap_to_window = true;

    auto out = normalize_work_pairs({work(360, 900)}, plan);
    EXPECT_EQ(out.pairs[0].start, 390);
    EXPECT_EQ(out.capped_minutes, 30);
}

TEST(NormalizerTest, EmptyInput) {
    auto out = normalize_work_pairs({}, fixed_plan("DAY", 480));
    EXPECT_TRUE(out.pairs.empty());
    EXPECT_FALSE(out.first_start);
}
