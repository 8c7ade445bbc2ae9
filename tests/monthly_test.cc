#include <gtest/gtest.h>

#include "core/monthly.h"

using namespace core;
using boost::gregorian::date;

namespace {

DailyResult normal(int net, int target) {
    DailyResult d;
    d.kind = DayKind::Normal;
    d.gross_minutes = net;
    d.net_minutes = net;
    d.target_minutes = target;
    d.overtime_minutes = net > target ? net - target : 0;
    d.undertime_minutes = target > net ? target - net : 0;
    return d;
}

DailyResult absence(AbsenceKind kind, const std::string& fraction) {
    DailyResult d;
    d.kind = DayKind::Absence;
    d.absence_kind = kind;
    d.absence_fraction = *Decimal::parse(fraction);
    d.target_minutes = 480;
    return d;
}

MonthlyEvaluation evaluation(CreditType type) {
    MonthlyEvaluation e;
    e.credit_type = type;
    return e;
}

} // namespace

TEST(MonthlyTest, AggregatesDays) {
    DailyResult broken = normal(0, 480);
    broken.errors.insert(ErrorCode::MissingGo);

    std::vector<DailyResult> days = {
        normal(540, 480),
        normal(450, 480),
        absence(AbsenceKind::Vacation, "0.5"),
        absence(AbsenceKind::Vacation, "1"),
        absence(AbsenceKind::Sick, "1"),
        broken,
    };
    auto r = aggregate_month(2024, 3, days, 100, std::nullopt);
    EXPECT_EQ(r.year, 2024);
    EXPECT_EQ(r.month, 3);
    EXPECT_EQ(r.net_minutes, 990);
    EXPECT_EQ(r.overtime_minutes, 60);
    EXPECT_EQ(r.undertime_minutes, 510);
    EXPECT_EQ(r.work_days, 2);
    EXPECT_EQ(r.error_days, 1);
    EXPECT_EQ(r.vacation_days.to_string(), "1.5");
    EXPECT_EQ(r.sick_days, Decimal::from_int(1));
    EXPECT_TRUE(r.other_absence_days.is_zero());
    EXPECT_EQ(r.flextime_start, 100);
    EXPECT_EQ(r.flextime_change, -450);
    EXPECT_EQ(r.flextime_end, -350);
}

TEST(MonthlyTest, CreditedDaysCountAsWorkDays) {
    DailyResult paid = absence(AbsenceKind::Vacation, "1");
    paid.gross_minutes = 480;
    paid.net_minutes = 480;

    DailyResult holiday;
    holiday.kind = DayKind::Holiday;
    holiday.net_minutes = 480;

    DailyResult off;
    off.kind = DayKind::OffDay;

    auto r = aggregate_month(2024, 5, {normal(480, 480), paid, holiday, off,
                                       absence(AbsenceKind::Other, "1")}, 0, std::nullopt);
    EXPECT_EQ(r.work_days, 3);
}

TEST(MonthlyTest, NoEvaluationKeepsRawBalance) {
    auto r = aggregate_month(2024, 1, {normal(540, 480), normal(450, 480)}, 100,
                             evaluation(CreditType::NoEvaluation));
    EXPECT_EQ(r.flextime_change, 30);
    EXPECT_EQ(r.flextime_credited, 30);
    EXPECT_EQ(r.flextime_end, 130);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(MonthlyTest, CompleteCarryoverWithBalanceCap) {
    MonthlyEvaluation e = evaluation(CreditType::CompleteCarryover);
    e.flextime_cap_positive = 600;
    auto r = aggregate_month(2024, 1, {normal(1180, 480)}, 0, e);
    EXPECT_EQ(r.flextime_credited, 700);
    EXPECT_EQ(r.flextime_end, 600);
    EXPECT_EQ(r.flextime_forfeited, 100);
    EXPECT_TRUE(r.warnings.count(WarningCode::FlextimeCapped));
}

TEST(MonthlyTest, NegativeCapRaisesBalance) {
    MonthlyEvaluation e = evaluation(CreditType::CompleteCarryover);
    e.flextime_cap_negative = 600;
    auto r = aggregate_month(2024, 1, {normal(280, 480)}, -500, e);
    EXPECT_EQ(r.flextime_end, -600);
    EXPECT_EQ(r.flextime_forfeited, 0);
    EXPECT_TRUE(r.warnings.count(WarningCode::FlextimeCapped));
}

TEST(MonthlyTest, MonthlyCreditCap) {
    MonthlyEvaluation e = evaluation(CreditType::CompleteCarryover);
    e.max_flextime_per_month = 300;
    auto r = aggregate_month(2024, 1, {normal(980, 480)}, 0, e);
    EXPECT_EQ(r.flextime_credited, 300);
    EXPECT_EQ(r.flextime_forfeited, 200);
    EXPECT_EQ(r.flextime_end, 300);
    EXPECT_TRUE(r.warnings.count(WarningCode::MonthlyCapReached));
}

TEST(MonthlyTest, AfterThreshold) {
    MonthlyEvaluation e = evaluation(CreditType::AfterThreshold);
    e.flextime_threshold = 60;

    auto r = aggregate_month(2024, 1, {normal(580, 480)}, 0, e);
    EXPECT_EQ(r.flextime_credited, 40);
    EXPECT_EQ(r.flextime_forfeited, 60);
    EXPECT_EQ(r.flextime_end, 40);

    r = aggregate_month(2024, 1, {normal(530, 480)}, 20, e);
    EXPECT_EQ(r.flextime_credited, 0);
    EXPECT_EQ(r.flextime_forfeited, 50);
    EXPECT_EQ(r.flextime_end, 20);
    EXPECT_TRUE(r.warnings.count(WarningCode::BelowThreshold));

    r = aggregate_month(2024, 1, {normal(450, 480)}, 0, e);
    EXPECT_EQ(r.flextime_credited, -30);
    EXPECT_EQ(r.flextime_end, -30);
}

TEST(MonthlyTest, NoCarryover) {
    auto r = aggregate_month(2024, 1, {normal(510, 480)}, 100, evaluation(CreditType::NoCarryover));
    EXPECT_EQ(r.flextime_end, 0);
    EXPECT_EQ(r.flextime_forfeited, 30);
    EXPECT_TRUE(r.warnings.count(WarningCode::NoCarryover));
}

TEST(MonthlyTest, AnnualCarryoverFloor) {
    EXPECT_EQ(annual_carryover(-600, 300), -300);
    EXPECT_EQ(annual_carryover(200, 300), 200);
    EXPECT_EQ(annual_carryover(-600, std::nullopt), -600);
}

TEST(MonthSheetTest, UpsertReplacesDay) {
    MonthSheet sheet(2024, 3);
    EXPECT_EQ(sheet.upsert_day(date(2024, 3, 4), normal(540, 480)), TransitionStatus::Ok);
    EXPECT_EQ(sheet.upsert_day(date(2024, 3, 4), normal(500, 480)), TransitionStatus::Ok);
    EXPECT_EQ(sheet.day_count(), 1u);
    EXPECT_EQ(sheet.result().net_minutes, 500);
    EXPECT_EQ(sheet.upsert_day(date(2024, 4, 1), normal(500, 480)), TransitionStatus::OutOfRange);
}

TEST(MonthSheetTest, CloseAndReopen) {
    MonthSheet sheet(2024, 3, 60);
    ASSERT_EQ(sheet.upsert_day(date(2024, 3, 4), normal(540, 480)), TransitionStatus::Ok);

    EXPECT_EQ(sheet.reopen("hr", 1), TransitionStatus::NotClosed);
    EXPECT_EQ(sheet.close("hr", 100), TransitionStatus::Ok);
    EXPECT_TRUE(sheet.is_closed());
    EXPECT_EQ(sheet.result().closed_by, "hr");
    EXPECT_EQ(sheet.result().flextime_end, 120);

    EXPECT_EQ(sheet.close("hr", 101), TransitionStatus::AlreadyClosed);
    EXPECT_EQ(sheet.upsert_day(date(2024, 3, 5), normal(480, 480)), TransitionStatus::AlreadyClosed);
    EXPECT_EQ(sheet.day_count(), 1u);

    EXPECT_EQ(sheet.reopen("lead", 200), TransitionStatus::Ok);
    EXPECT_FALSE(sheet.is_closed());
    EXPECT_EQ(sheet.result().reopened_by, "lead");
    EXPECT_EQ(sheet.upsert_day(date(2024, 3, 5), normal(480, 480)), TransitionStatus::Ok);
    EXPECT_EQ(sheet.result().reopened_by, "lead");
}
