#include <gtest/gtest.h>

#include "database/account_dao.h"
#include "database/daily_value_dao.h"
#include "database/database_manager.h"
#include "database/monthly_value_dao.h"
#include "service/time_tracking_service.h"
#include "test_helpers.h"

using namespace core;
using namespace testing_helpers;
using boost::gregorian::date;
using service::DayOutcome;

namespace {

class TimeTrackingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db::DatabaseManager::instance().open(":memory:"));
        service_.register_plan(fixed_plan("DAY", 480));

        ScheduleConfig skip = fixed_plan("SKIP", 480);
        skip.no_booking_policy = NoBookingPolicy::Skip;
        service_.register_plan(skip);
    }

    void TearDown() override {
        db::DatabaseManager::instance().close();
    }

    DayOutcome work_day(const date& d, int come_at, int go_at) {
        return service_.recalculate_day("E1", d, "DAY", {come("c", come_at), go("g", go_at)});
    }

    service::TimeTrackingService service_;
    db::DailyValueDao daily_;
    db::MonthlyValueDao monthly_;
    db::AccountDao accounts_;
};

AbsenceFact vacation_day() {
    AbsenceFact a;
    a.type_code = "VAC";
    a.kind = AbsenceKind::Vacation;
    return a;
}

} // namespace

TEST_F(TimeTrackingServiceTest, PlanRegistry) {
    EXPECT_EQ(service_.plan_count(), 2u);
    ASSERT_NE(service_.find_plan("DAY"), nullptr);
    EXPECT_EQ(service_.find_plan("NOPE"), nullptr);
}

TEST_F(TimeTrackingServiceTest, RecalculateDayStoresResult) {
    auto outcome = work_day(date(2024, 3, 4), 480, 1020);
    EXPECT_EQ(outcome.status, db::WriteStatus::Written);
    ASSERT_TRUE(outcome.result);
    EXPECT_EQ(outcome.result->net_minutes, 540);

    auto stored = daily_.get("E1", date(2024, 3, 4));
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->overtime_minutes, 60);
}

TEST_F(TimeTrackingServiceTest, UnknownPlanIsOffDay) {
    auto outcome = service_.recalculate_day("E1", date(2024, 3, 4), "NOPE", {});
    ASSERT_TRUE(outcome.result);
    EXPECT_EQ(outcome.result->kind, DayKind::OffDay);
}

TEST_F(TimeTrackingServiceTest, SkipPolicyRemovesStoredDay) {
    ASSERT_EQ(service_.recalculate_day("E1", date(2024, 3, 4), "SKIP", {come("c", 480), go("g", 960)}).status,
              db::WriteStatus::Written);
    ASSERT_TRUE(daily_.get("E1", date(2024, 3, 4)));

    auto outcome = service_.recalculate_day("E1", date(2024, 3, 4), "SKIP", {});
    EXPECT_FALSE(outcome.result);
    EXPECT_EQ(outcome.status, db::WriteStatus::Written);
    EXPECT_FALSE(daily_.get("E1", date(2024, 3, 4)));
}

TEST_F(TimeTrackingServiceTest, MonthAggregatesStoredDays) {
    work_day(date(2024, 3, 4), 480, 1020);
    work_day(date(2024, 3, 5), 480, 990);
    service_.recalculate_day("E1", date(2024, 3, 6), "DAY", {}, vacation_day());

    auto outcome = service_.recalculate_month("E1", 2024, 3);
    ASSERT_EQ(outcome.status, db::WriteStatus::Written);
    ASSERT_TRUE(outcome.result);
    EXPECT_EQ(outcome.result->work_days, 3);
    EXPECT_EQ(outcome.result->flextime_end, 90);
    EXPECT_EQ(outcome.result->vacation_days, Decimal::from_int(1));

    auto flextime = accounts_.get("E1", AccountKind::Flextime, 2024);
    ASSERT_TRUE(flextime);
    EXPECT_EQ(flextime->current_balance, Decimal::from_int(90));

    auto vacation = accounts_.get("E1", AccountKind::Vacation, 2024);
    ASSERT_TRUE(vacation);
    EXPECT_EQ(vacation->used, Decimal::from_int(1));
}

TEST_F(TimeTrackingServiceTest, CarryoverFromPreviousMonth) {
    work_day(date(2024, 3, 4), 480, 1020);
    ASSERT_EQ(service_.recalculate_month("E1", 2024, 3).status, db::WriteStatus::Written);

    work_day(date(2024, 4, 1), 480, 930);
    auto april = service_.recalculate_month("E1", 2024, 4);
    ASSERT_TRUE(april.result);
    EXPECT_EQ(april.result->flextime_start, 60);
    EXPECT_EQ(april.result->flextime_end, 30);
}

TEST_F(TimeTrackingServiceTest, JanuaryStartsFromLedgerOpening) {
    AccountLedgerEntry entry;
    entry.employee_id = "E1";
    entry.kind = AccountKind::Flextime;
    entry.year = 2024;
    entry.opening_balance = Decimal::from_int(120);
    entry.current_balance = Decimal::from_int(120);
    ASSERT_EQ(accounts_.upsert(entry), db::WriteStatus::Written);

    auto january = service_.recalculate_month("E1", 2024, 1);
    ASSERT_TRUE(january.result);
    EXPECT_EQ(january.result->flextime_start, 120);
    EXPECT_EQ(january.result->flextime_end, 120);
}

TEST_F(TimeTrackingServiceTest, OpenYearCarriesDecemberIntoJanuary) {
    work_day(date(2023, 12, 4), 480, 1020);
    work_day(date(2023, 12, 5), 480, 1020);
    ASSERT_EQ(service_.recalculate_month("E1", 2023, 12).status, db::WriteStatus::Written);

    work_day(date(2024, 1, 8), 480, 990);
    ASSERT_EQ(service_.recalculate_month("E1", 2024, 1).result->flextime_start, 120);

    // 一月重算后已有 2024 台账 (期初 0), 未结账时仍沿用十二月余额
    auto again = service_.recalculate_month("E1", 2024, 1);
    ASSERT_TRUE(again.result);
    EXPECT_EQ(again.result->flextime_start, 120);
    EXPECT_EQ(again.result->flextime_end, 150);
}

TEST_F(TimeTrackingServiceTest, ClosedYearCapsCarryIntoJanuary) {
    work_day(date(2023, 12, 4), 480, 1020);
    work_day(date(2023, 12, 5), 480, 1020);
    ASSERT_EQ(service_.recalculate_month("E1", 2023, 12).status, db::WriteStatus::Written);
    ASSERT_EQ(accounts_.get("E1", AccountKind::Flextime, 2023)->current_balance, Decimal::from_int(120));

    YearEndCaps caps;
    caps.positive_limit = Decimal::from_int(100);
    service_.set_year_end_caps(AccountKind::Flextime, caps);
    ASSERT_EQ(service_.close_year("E1", AccountKind::Flextime, 2023), TransitionStatus::Ok);
    ASSERT_EQ(accounts_.get("E1", AccountKind::Flextime, 2024)->opening_balance, Decimal::from_int(100));

    work_day(date(2024, 1, 8), 480, 990);
    for (int pass = 0; pass < 2; ++pass) {
        auto january = service_.recalculate_month("E1", 2024, 1);
        ASSERT_TRUE(january.result);
        EXPECT_EQ(january.result->flextime_start, 100);
        EXPECT_EQ(january.result->flextime_end, 130);
    }

    auto ledger = accounts_.get("E1", AccountKind::Flextime, 2024);
    ASSERT_TRUE(ledger);
    EXPECT_EQ(ledger->opening_balance, Decimal::from_int(100));
    EXPECT_EQ(ledger->current_balance, Decimal::from_int(130));
}

TEST_F(TimeTrackingServiceTest, MonthlyEvaluationApplied) {
    MonthlyEvaluation rules;
    rules.credit_type = CreditType::CompleteCarryover;
    rules.max_flextime_per_month = 30;
    service_.set_monthly_evaluation(rules);

    work_day(date(2024, 3, 4), 480, 1020);
    auto outcome = service_.recalculate_month("E1", 2024, 3);
    ASSERT_TRUE(outcome.result);
    EXPECT_EQ(outcome.result->flextime_end, 30);
    EXPECT_TRUE(outcome.result->warnings.count(WarningCode::MonthlyCapReached));
}

TEST_F(TimeTrackingServiceTest, ClosedMonthIsFrozen) {
    work_day(date(2024, 3, 4), 480, 1020);
    EXPECT_EQ(service_.close_month("E1", 2024, 3, "hr", 1000), TransitionStatus::Ok);
    EXPECT_TRUE(monthly_.is_closed("E1", 2024, 3));

    auto outcome = work_day(date(2024, 3, 4), 480, 600);
    EXPECT_EQ(outcome.status, db::WriteStatus::Rejected);
    EXPECT_EQ(daily_.get("E1", date(2024, 3, 4))->net_minutes, 540);

    EXPECT_EQ(service_.recalculate_month("E1", 2024, 3).status, db::WriteStatus::Rejected);
    EXPECT_EQ(service_.close_month("E1", 2024, 3, "hr", 1001), TransitionStatus::AlreadyClosed);

    EXPECT_EQ(service_.reopen_month("E1", 2024, 3, "hr", 2000), TransitionStatus::Ok);
    EXPECT_EQ(service_.reopen_month("E1", 2024, 3, "hr", 2001), TransitionStatus::NotClosed);
    EXPECT_EQ(work_day(date(2024, 3, 4), 480, 600).status, db::WriteStatus::Written);
}

TEST_F(TimeTrackingServiceTest, InvalidMonth) {
    auto outcome = service_.recalculate_month("E1", 2024, 13);
    EXPECT_EQ(outcome.status, db::WriteStatus::Failed);
    EXPECT_FALSE(outcome.result);
}

TEST_F(TimeTrackingServiceTest, AssignVacation) {
    VacationCalcInput input;
    input.birth_date = date(1990, 1, 1);
    input.entry_date = date(2024, 7, 1);
    input.weekly_hours = Decimal::from_int(40);
    input.standard_weekly_hours = Decimal::from_int(40);
    input.base_days = Decimal::from_int(30);
    input.year = 2024;
    input.reference_date = date(2024, 12, 31);

    auto output = service_.assign_vacation("E1", input);
    ASSERT_TRUE(output);
    EXPECT_EQ(output->total_entitlement, Decimal::from_int(15));

    auto entry = accounts_.get("E1", AccountKind::Vacation, 2024);
    ASSERT_TRUE(entry);
    EXPECT_EQ(entry->yearly_entitlement, Decimal::from_int(15));
}

TEST_F(TimeTrackingServiceTest, YearCloseUsesConfiguredCaps) {
    AccountLedgerEntry entry;
    entry.employee_id = "E1";
    entry.kind = AccountKind::Flextime;
    entry.year = 2023;
    entry.current_balance = Decimal::from_int(-900);
    ASSERT_EQ(accounts_.upsert(entry), db::WriteStatus::Written);

    MonthlyEvaluation rules;
    rules.annual_floor_balance = 300;
    service_.set_monthly_evaluation(rules);

    EXPECT_EQ(service_.close_year("E1", AccountKind::Flextime, 2023), TransitionStatus::Ok);
    auto next = accounts_.get("E1", AccountKind::Flextime, 2024);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->opening_balance, Decimal::from_int(-300));

    EXPECT_EQ(service_.close_year("E1", AccountKind::Flextime, 2023), TransitionStatus::AlreadyClosed);
    EXPECT_EQ(service_.reopen_year("E1", AccountKind::Flextime, 2023), TransitionStatus::Ok);
}

TEST_F(TimeTrackingServiceTest, ExplicitCapsWinOverFloor) {
    AccountLedgerEntry entry;
    entry.employee_id = "E1";
    entry.kind = AccountKind::Flextime;
    entry.year = 2023;
    entry.current_balance = Decimal::from_int(-900);
    ASSERT_EQ(accounts_.upsert(entry), db::WriteStatus::Written);

    MonthlyEvaluation rules;
    rules.annual_floor_balance = 300;
    service_.set_monthly_evaluation(rules);
    YearEndCaps caps;
    caps.negative_limit = Decimal::from_int(600);
    service_.set_year_end_caps(AccountKind::Flextime, caps);

    ASSERT_EQ(service_.close_year("E1", AccountKind::Flextime, 2023), TransitionStatus::Ok);
    EXPECT_EQ(accounts_.get("E1", AccountKind::Flextime, 2024)->opening_balance, Decimal::from_int(-600));
}
