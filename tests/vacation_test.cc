#include <gtest/gtest.h>

#include "core/vacation.h"

using namespace core;
using boost::gregorian::date;

namespace {

VacationCalcInput full_time(int year) {
    VacationCalcInput in;
    in.birth_date = date(1990, 5, 10);
    in.entry_date = date(2015, 1, 1);
    in.weekly_hours = Decimal::from_int(40);
    in.standard_weekly_hours = Decimal::from_int(40);
    in.base_days = Decimal::from_int(30);
    in.year = year;
    in.reference_date = date(year, 12, 31);
    return in;
}

} // namespace

TEST(VacationTest, FullYearFullTime) {
    auto out = calculate_vacation(full_time(2024));
    EXPECT_EQ(out.months_employed, 12);
    EXPECT_EQ(out.total_entitlement.to_string(), "30.0");
}

TEST(VacationTest, PartTimeScaling) {
    auto in = full_time(2024);
    in.weekly_hours = Decimal::from_int(20);
    EXPECT_EQ(calculate_vacation(in).total_entitlement.to_string(), "15.0");
}

TEST(VacationTest, MidYearEntry) {
    auto in = full_time(2024);
    in.entry_date = date(2024, 7, 1);
    auto out = calculate_vacation(in);
    EXPECT_EQ(out.months_employed, 6);
    EXPECT_EQ(out.total_entitlement.to_string(), "15.0");

    in.entry_date = date(2024, 7, 15);
    EXPECT_EQ(calculate_vacation(in).months_employed, 6);
}

TEST(VacationTest, ExitDuringYear) {
    auto in = full_time(2024);
    in.exit_date = date(2024, 3, 31);
    auto out = calculate_vacation(in);
    EXPECT_EQ(out.months_employed, 3);
    EXPECT_EQ(out.total_entitlement.to_string(), "7.5");
}

TEST(VacationTest, ProratedTotalRoundsToHalfDay) {
    auto in = full_time(2024);
    in.base_days = Decimal::from_int(25);
    in.entry_date = date(2024, 8, 1);
    auto out = calculate_vacation(in);
    EXPECT_EQ(out.months_employed, 5);
    EXPECT_EQ(out.prorated_entitlement.round_to_int(), 10);
    EXPECT_EQ(out.total_entitlement.to_string(), "10.5");
}

TEST(VacationTest, QuarterDayRoundsUpExactly) {
    auto in = full_time(2024);
    in.entry_date = date(2024, 12, 1);
    in.weekly_hours = Decimal::from_int(20);
    auto out = calculate_vacation(in);
    EXPECT_EQ(out.months_employed, 1);
    EXPECT_EQ(out.prorated_entitlement.to_string(), "2.5");
    EXPECT_EQ(out.part_time_entitlement.to_string(), "1.25");
    EXPECT_EQ(out.total_entitlement.to_string(), "1.5");

    in.weekly_hours = Decimal::from_int(40);
    in.base_days = Decimal::from_int(27);
    out = calculate_vacation(in);
    EXPECT_EQ(out.part_time_entitlement.to_string(), "2.25");
    EXPECT_EQ(out.total_entitlement.to_string(), "2.5");
}

TEST(VacationTest, SpecialRuleBonuses) {
    auto in = full_time(2024);
    in.birth_date = date(1970, 1, 1);
    in.entry_date = date(2010, 1, 1);
    in.has_disability = true;
    in.special_rules = {
        {SpecialRuleKind::Age, 50, Decimal::from_int(2)},
        {SpecialRuleKind::Age, 60, Decimal::from_int(4)},
        {SpecialRuleKind::Tenure, 10, Decimal::from_int(1)},
        {SpecialRuleKind::Disability, 0, Decimal::from_int(5)},
    };
    auto out = calculate_vacation(in);
    EXPECT_EQ(out.age_at_reference, 54);
    EXPECT_EQ(out.tenure_years, 14);
    EXPECT_EQ(out.age_bonus, Decimal::from_int(2));
    EXPECT_EQ(out.tenure_bonus, Decimal::from_int(1));
    EXPECT_EQ(out.disability_bonus, Decimal::from_int(5));
    EXPECT_EQ(out.total_entitlement.to_string(), "38.0");
}

TEST(VacationTest, NoStandardHoursSkipsScaling) {
    auto in = full_time(2024);
    in.weekly_hours = Decimal::from_int(20);
    in.standard_weekly_hours = Decimal();
    EXPECT_EQ(calculate_vacation(in).total_entitlement, Decimal::from_int(30));
}

TEST(VacationTest, AgeAroundBirthday) {
    EXPECT_EQ(calculate_age(date(2000, 6, 15), date(2024, 6, 14)), 23);
    EXPECT_EQ(calculate_age(date(2000, 6, 15), date(2024, 6, 15)), 24);
    EXPECT_EQ(calculate_age(date(2004, 2, 29), date(2023, 2, 28)), 18);
    EXPECT_EQ(calculate_age(date(2004, 2, 29), date(2023, 3, 1)), 19);
    EXPECT_EQ(calculate_age(date(2030, 1, 1), date(2024, 1, 1)), 0);
}

TEST(VacationTest, TenureBeforeEntry) {
    EXPECT_EQ(calculate_tenure(date(2025, 1, 1), date(2024, 6, 1)), 0);
    EXPECT_EQ(calculate_tenure(date(2020, 3, 1), date(2024, 2, 29)), 3);
    EXPECT_EQ(calculate_tenure(date(2020, 3, 1), date(2024, 3, 1)), 4);
}

TEST(VacationTest, EntryDateBasis) {
    EXPECT_EQ(months_employed(date(2023, 3, 15), std::nullopt, 2024, VacationBasis::EntryDate), 12);
    EXPECT_EQ(months_employed(date(2025, 2, 1), std::nullopt, 2024, VacationBasis::CalendarYear), 0);
}

TEST(VacationTest, AddMonthsClampsToMonthEnd) {
    EXPECT_EQ(add_months(date(2024, 1, 31), 1), date(2024, 2, 29));
    EXPECT_EQ(add_months(date(2023, 1, 31), 1), date(2023, 2, 28));
    EXPECT_EQ(add_months(date(2024, 11, 30), 2), date(2025, 1, 30));
}

TEST(VacationTest, Carryover) {
    EXPECT_EQ(calculate_carryover(Decimal::from_int(15), Decimal::from_int(10)), Decimal::from_int(10));
    EXPECT_TRUE(calculate_carryover(Decimal::from_int(-2), Decimal::from_int(10)).is_zero());
    EXPECT_EQ(calculate_carryover(Decimal::from_int(12), std::nullopt), Decimal::from_int(12));
}

TEST(VacationTest, BasisNames) {
    EXPECT_EQ(parse_vacation_basis("entry_date"), VacationBasis::EntryDate);
    EXPECT_EQ(parse_special_rule_kind("tenure"), SpecialRuleKind::Tenure);
    EXPECT_FALSE(parse_vacation_basis("fiscal"));
}
