#include <gtest/gtest.h>

#include "database/account_dao.h"
#include "database/daily_value_dao.h"
#include "database/database_manager.h"
#include "database/monthly_value_dao.h"

using namespace db;
using boost::gregorian::date;

namespace {

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(DatabaseManager::instance().open(":memory:"));
    }

    void TearDown() override {
        DatabaseManager::instance().close();
    }

    core::DailyResult worked_day(int net) {
        core::DailyResult r;
        r.kind = core::DayKind::Normal;
        r.plan_code = "DAY";
        r.gross_minutes = net;
        r.net_minutes = net;
        r.target_minutes = 480;
        r.overtime_minutes = net > 480 ? net - 480 : 0;
        r.undertime_minutes = net < 480 ? 480 - net : 0;
        r.booking_count = 2;
        r.first_come = 480;
        r.last_go = 480 + net;
        return r;
    }

    core::MonthlyResult month(int year, int m, int flextime_end) {
        core::MonthlyResult r;
        r.year = year;
        r.month = m;
        r.flextime_end = flextime_end;
        return r;
    }

    DailyValueDao daily_;
    MonthlyValueDao monthly_;
    AccountDao accounts_;
};

} // namespace

TEST(DatabaseTypesTest, DateText) {
    EXPECT_EQ(to_db_date(date(2024, 3, 5)), "2024-03-05");
    EXPECT_EQ(from_db_date("2024-03-05"), date(2024, 3, 5));
    EXPECT_FALSE(from_db_date("garbage"));
    EXPECT_FALSE(from_db_date("2024-02-30"));
}

TEST_F(DatabaseTest, DailyValueRoundTrip) {
    core::DailyResult r = worked_day(540);
    r.errors.insert(core::ErrorCode::MissingBreakEnd);
    r.warnings.insert(core::WarningCode::LongWorkDay);
    r.surcharges.push_back({"NIGHT", 30});
    r.surcharges.push_back({"NIGHT", 15});

    ASSERT_EQ(daily_.upsert("E1", date(2024, 3, 4), r), WriteStatus::Written);

    auto stored = daily_.get("E1", date(2024, 3, 4));
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->kind, core::DayKind::Normal);
    EXPECT_EQ(stored->plan_code, "DAY");
    EXPECT_EQ(stored->net_minutes, 540);
    EXPECT_EQ(stored->overtime_minutes, 60);
    EXPECT_EQ(stored->first_come, 480);
    EXPECT_EQ(stored->last_go, 1020);
    EXPECT_EQ(stored->errors, r.errors);
    EXPECT_EQ(stored->warnings, r.warnings);
    ASSERT_EQ(stored->surcharges.size(), 1u);
    EXPECT_EQ(stored->surcharges[0].minutes, 45);
}

TEST_F(DatabaseTest, AbsenceFieldsRoundTrip) {
    core::DailyResult r;
    r.kind = core::DayKind::Absence;
    r.absence_kind = core::AbsenceKind::Sick;
    r.absence_fraction = *core::Decimal::parse("0.5");
    ASSERT_EQ(daily_.upsert("E1", date(2024, 3, 5), r), WriteStatus::Written);

    auto stored = daily_.get("E1", date(2024, 3, 5));
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->absence_kind, core::AbsenceKind::Sick);
    EXPECT_EQ(stored->absence_fraction, r.absence_fraction);
    EXPECT_FALSE(stored->first_come);
}

TEST_F(DatabaseTest, UpsertReplacesDay) {
    ASSERT_EQ(daily_.upsert("E1", date(2024, 3, 4), worked_day(540)), WriteStatus::Written);
    core::DailyResult second = worked_day(400);
    ASSERT_EQ(daily_.upsert("E1", date(2024, 3, 4), second), WriteStatus::Written);

    auto stored = daily_.get("E1", date(2024, 3, 4));
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->net_minutes, 400);
    EXPECT_TRUE(stored->surcharges.empty());
    EXPECT_EQ(daily_.get_month("E1", 2024, 3).size(), 1u);
}

TEST_F(DatabaseTest, MonthQueryIsOrderedAndScoped) {
    daily_.upsert("E1", date(2024, 3, 20), worked_day(480));
    daily_.upsert("E1", date(2024, 3, 4), worked_day(500));
    daily_.upsert("E1", date(2024, 4, 1), worked_day(510));
    daily_.upsert("E2", date(2024, 3, 5), worked_day(520));

    auto days = daily_.get_month("E1", 2024, 3);
    ASSERT_EQ(days.size(), 2u);
    EXPECT_EQ(days[0].first, date(2024, 3, 4));
    EXPECT_EQ(days[1].first, date(2024, 3, 20));
}

TEST_F(DatabaseTest, ClosedMonthRejectsDailyWrites) {
    ASSERT_EQ(daily_.upsert("E1", date(2024, 3, 4), worked_day(540)), WriteStatus::Written);
    ASSERT_EQ(monthly_.upsert("E1", month(2024, 3, 60)), WriteStatus::Written);
    ASSERT_EQ(monthly_.close("E1", 2024, 3, "hr", 1000), core::TransitionStatus::Ok);

    EXPECT_EQ(daily_.upsert("E1", date(2024, 3, 4), worked_day(300)), WriteStatus::Rejected);
    EXPECT_EQ(daily_.upsert("E1", date(2024, 3, 5), worked_day(300)), WriteStatus::Rejected);
    EXPECT_EQ(daily_.remove("E1", date(2024, 3, 4)), WriteStatus::Rejected);
    EXPECT_EQ(daily_.get("E1", date(2024, 3, 4))->net_minutes, 540);

    // 其他员工和其他月份不受影响
    EXPECT_EQ(daily_.upsert("E2", date(2024, 3, 4), worked_day(300)), WriteStatus::Written);
    EXPECT_EQ(daily_.upsert("E1", date(2024, 4, 1), worked_day(300)), WriteStatus::Written);

    ASSERT_EQ(monthly_.reopen("E1", 2024, 3, "hr", 2000), core::TransitionStatus::Ok);
    EXPECT_EQ(daily_.upsert("E1", date(2024, 3, 4), worked_day(300)), WriteStatus::Written);
    EXPECT_EQ(daily_.remove("E1", date(2024, 3, 4)), WriteStatus::Written);
    EXPECT_FALSE(daily_.get("E1", date(2024, 3, 4)));
}

TEST_F(DatabaseTest, MonthlyCloseStateMachine) {
    EXPECT_EQ(monthly_.close("E1", 2024, 3, "hr", 1000), core::TransitionStatus::OutOfRange);

    core::MonthlyResult r = month(2024, 3, 60);
    r.vacation_days = *core::Decimal::parse("1.5");
    r.warnings.insert(core::WarningCode::MonthlyCapReached);
    ASSERT_EQ(monthly_.upsert("E1", r), WriteStatus::Written);
    EXPECT_FALSE(monthly_.is_closed("E1", 2024, 3));

    EXPECT_EQ(monthly_.reopen("E1", 2024, 3, "hr", 1000), core::TransitionStatus::NotClosed);
    EXPECT_EQ(monthly_.close("E1", 2024, 3, "hr", 1000), core::TransitionStatus::Ok);
    EXPECT_EQ(monthly_.close("E1", 2024, 3, "hr", 1001), core::TransitionStatus::AlreadyClosed);
    EXPECT_EQ(monthly_.upsert("E1", month(2024, 3, 999)), WriteStatus::Rejected);

    auto stored = monthly_.get("E1", 2024, 3);
    ASSERT_TRUE(stored);
    EXPECT_TRUE(stored->is_closed);
    EXPECT_EQ(stored->closed_by, "hr");
    EXPECT_EQ(stored->closed_at, 1000);
    EXPECT_EQ(stored->flextime_end, 60);
    EXPECT_EQ(stored->vacation_days, r.vacation_days);
    EXPECT_EQ(stored->warnings, r.warnings);

    EXPECT_EQ(monthly_.reopen("E1", 2024, 3, "lead", 2000), core::TransitionStatus::Ok);
    stored = monthly_.get("E1", 2024, 3);
    EXPECT_FALSE(stored->is_closed);
    EXPECT_EQ(stored->reopened_by, "lead");
    EXPECT_EQ(monthly_.upsert("E1", month(2024, 3, 90)), WriteStatus::Written);
    EXPECT_EQ(monthly_.get("E1", 2024, 3)->flextime_end, 90);
}

TEST_F(DatabaseTest, LedgerYearClose) {
    core::AccountLedgerEntry entry;
    entry.employee_id = "E1";
    entry.kind = core::AccountKind::Flextime;
    entry.year = 2024;
    entry.current_balance = core::Decimal::from_int(900);

    EXPECT_EQ(accounts_.close_year("E1", core::AccountKind::Flextime, 2024, {}),
              core::TransitionStatus::OutOfRange);
    ASSERT_EQ(accounts_.upsert(entry), WriteStatus::Written);

    core::YearEndCaps caps;
    caps.positive_limit = core::Decimal::from_int(600);
    EXPECT_EQ(accounts_.close_year("E1", core::AccountKind::Flextime, 2024, caps),
              core::TransitionStatus::Ok);

    auto closed = accounts_.get("E1", core::AccountKind::Flextime, 2024);
    ASSERT_TRUE(closed);
    EXPECT_TRUE(closed->is_closed);
    EXPECT_EQ(closed->closing_balance, core::Decimal::from_int(600));

    auto next = accounts_.get("E1", core::AccountKind::Flextime, 2025);
    ASSERT_TRUE(next);
    EXPECT_EQ(next->opening_balance, core::Decimal::from_int(600));
    EXPECT_FALSE(next->is_closed);

    EXPECT_EQ(accounts_.upsert(entry), WriteStatus::Rejected);
    EXPECT_EQ(accounts_.close_year("E1", core::AccountKind::Flextime, 2024, caps),
              core::TransitionStatus::AlreadyClosed);

    EXPECT_EQ(accounts_.reopen_year("E1", core::AccountKind::Flextime, 2024), core::TransitionStatus::Ok);
    EXPECT_EQ(accounts_.reopen_year("E1", core::AccountKind::Flextime, 2024), core::TransitionStatus::NotClosed);
    closed = accounts_.get("E1", core::AccountKind::Flextime, 2024);
    EXPECT_FALSE(closed->closing_balance);
    EXPECT_EQ(accounts_.upsert(entry), WriteStatus::Written);
}

TEST_F(DatabaseTest, ClosedDatabaseFails) {
    DatabaseManager::instance().close();
    EXPECT_EQ(daily_.upsert("E1", date(2024, 3, 4), worked_day(540)), WriteStatus::Failed);
    EXPECT_FALSE(monthly_.close("E1", 2024, 3, "hr", 0));
    EXPECT_FALSE(daily_.get("E1", date(2024, 3, 4)));
}
