#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include "config.h"
#include "core/codes.h"
#include "database/database_manager.h"
#include "database/daily_value_dao.h"
#include "service/config_loader.h"
#include "service/time_tracking_service.h"

namespace {

void print_usage() {
    std::cout << "Usage:" << std::endl;
    std::cout << "  wt_tool init <db_path>" << std::endl;
    std::cout << "  wt_tool calc <db_path> <employee> <YYYY-MM-DD> <plan|-> [come=HH:MM go=HH:MM break_start=HH:MM break_end=HH:MM ...]"
              << " [holiday=<category>] [absence=<vacation|sick|other>[:fraction]]" << std::endl;
    std::cout << "  wt_tool show <db_path> <employee> <YYYY-MM-DD>" << std::endl;
    std::cout << "  wt_tool month <db_path> <employee> <year> <month>" << std::endl;
    std::cout << "  wt_tool close-month <db_path> <employee> <year> <month> [actor]" << std::endl;
    std::cout << "  wt_tool reopen-month <db_path> <employee> <year> <month> [actor]" << std::endl;
    std::cout << "  wt_tool vacation <db_path> <employee> <year> <birth YYYY-MM-DD> <entry YYYY-MM-DD>"
              << " [weekly_hours] [base_days]" << std::endl;
    std::cout << "  wt_tool close-year <db_path> <employee> <flextime|vacation|overtime|surcharge> <year>" << std::endl;
    std::cout << "  wt_tool reopen-year <db_path> <employee> <flextime|vacation|overtime|surcharge> <year>" << std::endl;
    std::cout << "Day plans are read from $WT_PLANS or " << Config::Path::PLANS << std::endl;
    std::cout << "A db_path of - selects " << Config::Path::DATABASE << std::endl;
}

void print_day(const core::DailyResult& r) {
    std::cout << "kind\t" << core::to_string(r.kind) << std::endl;
    std::cout << "plan\t" << r.plan_code << std::endl;
    std::cout << "gross\t" << r.gross_minutes << std::endl;
    std::cout << "break\t" << r.break_minutes << std::endl;
    std::cout << "net\t" << r.net_minutes << std::endl;
    std::cout << "target\t" << r.target_minutes << std::endl;
    std::cout << "overtime\t" << r.overtime_minutes << std::endl;
    std::cout << "undertime\t" << r.undertime_minutes << std::endl;
    if (r.first_come) std::cout << "first_come\t" << core::format_clock(*r.first_come) << std::endl;
    if (r.last_go) std::cout << "last_go\t" << core::format_clock(*r.last_go) << std::endl;
    for (const auto& s : r.surcharges) {
        std::cout << "surcharge\t" << s.account << "\t" << s.minutes << std::endl;
    }
    std::cout << "errors\t" << core::join_codes(r.errors) << std::endl;
    std::cout << "warnings\t" << core::join_codes(r.warnings) << std::endl;
}

bool parse_int(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

// 解析 calc 命令的 key=value 参数
bool parse_day_args(int argc, char* argv[], int first,
                    std::vector<core::BookingEvent>& bookings,
                    std::optional<core::AbsenceFact>& absence,
                    bool& is_holiday, std::optional<int>& holiday_category) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        size_t eq = arg.find('=');
        if (eq == std::string::npos) return false;
        std::string key = arg.substr(0, eq);
        std::string value = arg.substr(eq + 1);

        if (key == "holiday") {
            int category = 0;
            if (!parse_int(value, category)) return false;
            is_holiday = true;
            holiday_category = category;
        } else if (key == "absence") {
            core::AbsenceFact fact;
            std::string kind = value;
            size_t colon = value.find(':');
            if (colon != std::string::npos) {
                kind = value.substr(0, colon);
                auto fraction = core::Decimal::parse(value.substr(colon + 1));
                if (!fraction) return false;
                fact.duration_fraction = *fraction;
            }
            auto parsed = core::parse_absence_kind(kind);
            if (!parsed) return false;
            fact.kind = *parsed;
            fact.type_code = kind;
            absence = fact;
        } else {
            auto category = core::parse_booking_category(key);
            auto minutes = core::parse_clock(value);
            if (!category || !minutes) return false;

            core::BookingEvent b;
            b.id = "b" + std::to_string(bookings.size() + 1);
            b.category = *category;
            b.original_time = *minutes;
            bookings.push_back(b);
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    if (argc < 3) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::string db_path = argv[2];
    if (db_path == "-") db_path = Config::Path::DATABASE;

    // 确保数据库目录存在
    QDir dbDir = QFileInfo(QString::fromStdString(db_path)).dir();
    if (!dbDir.exists()) {
        dbDir.mkpath(".");
        std::cout << "Created database directory: " << dbDir.absolutePath().toStdString() << std::endl;
    }

    if (!db::DatabaseManager::instance().open(db_path)) {
        std::cerr << "Failed to open database: " << db_path << std::endl;
        return 1;
    }

    if (command == "init") {
        std::cout << "Database initialized successfully at " << db_path << std::endl;
        return 0;
    }

    service::TimeTrackingService svc;
    QByteArray plans_env = qgetenv("WT_PLANS");
    std::string plans_path = plans_env.isEmpty() ? Config::Path::PLANS : plans_env.toStdString();
    if (QFileInfo::exists(QString::fromStdString(plans_path))) {
        service::ConfigLoader loader;
        if (!loader.load_file(plans_path)) {
            std::cerr << "Invalid configuration: " << plans_path << std::endl;
            return 1;
        }
        loader.apply(svc);
    }

    if (argc < 4) {
        print_usage();
        return 1;
    }
    std::string employee = argv[3];

    if (command == "calc" || command == "show") {
        if (argc < 5 || (command == "calc" && argc < 6)) {
            print_usage();
            return 1;
        }
        auto date = db::from_db_date(argv[4]);
        if (!date) {
            std::cerr << "Invalid date: " << argv[4] << std::endl;
            return 1;
        }

        if (command == "show") {
            db::DailyValueDao dao;
            auto stored = dao.get(employee, *date);
            if (!stored) {
                std::cerr << "No daily value stored" << std::endl;
                return 1;
            }
            print_day(*stored);
            return 0;
        }

        std::string plan = argv[5];
        if (plan == "-") plan.clear();

        std::vector<core::BookingEvent> bookings;
        std::optional<core::AbsenceFact> absence;
        bool is_holiday = false;
        std::optional<int> holiday_category;
        if (!parse_day_args(argc, argv, 6, bookings, absence, is_holiday, holiday_category)) {
            print_usage();
            return 1;
        }

        service::DayOutcome outcome = svc.recalculate_day(employee, *date, plan, bookings,
                                                          absence, is_holiday, holiday_category);
        if (outcome.result) print_day(*outcome.result);
        return outcome.status == db::WriteStatus::Written ? 0 : 2;
    }

    if (command == "month" || command == "close-month" || command == "reopen-month") {
        int year = 0;
        int month = 0;
        if (argc < 6 || !parse_int(argv[4], year) || !parse_int(argv[5], month)) {
            print_usage();
            return 1;
        }
        std::string actor = argc >= 7 ? argv[6] : Config::Default::SYSTEM_ACTOR;

        if (command == "month") {
            service::MonthOutcome outcome = svc.recalculate_month(employee, year, month);
            if (outcome.result) {
                const core::MonthlyResult& m = *outcome.result;
                std::cout << "net\t" << m.net_minutes << std::endl;
                std::cout << "target\t" << m.target_minutes << std::endl;
                std::cout << "flextime_start\t" << m.flextime_start << std::endl;
                std::cout << "flextime_change\t" << m.flextime_change << std::endl;
                std::cout << "flextime_end\t" << m.flextime_end << std::endl;
                std::cout << "work_days\t" << m.work_days << std::endl;
                std::cout << "error_days\t" << m.error_days << std::endl;
                std::cout << "vacation_days\t" << m.vacation_days.to_string() << std::endl;
                std::cout << "warnings\t" << core::join_codes(m.warnings) << std::endl;
            }
            return outcome.status == db::WriteStatus::Written ? 0 : 2;
        }

        auto status = command == "close-month" ? svc.close_month(employee, year, month, actor)
                                               : svc.reopen_month(employee, year, month, actor);
        if (!status) return 1;
        std::cout << core::to_string(*status) << std::endl;
        return *status == core::TransitionStatus::Ok ? 0 : 2;
    }

    if (command == "vacation") {
        int year = 0;
        if (argc < 7 || !parse_int(argv[4], year)) {
            print_usage();
            return 1;
        }
        auto birth = db::from_db_date(argv[5]);
        auto entry = db::from_db_date(argv[6]);
        if (!birth || !entry) {
            std::cerr << "Invalid date" << std::endl;
            return 1;
        }

        core::VacationCalcInput input;
        input.birth_date = *birth;
        input.entry_date = *entry;
        input.year = year;
        input.reference_date = boost::gregorian::date(year, 12, 31);
        input.standard_weekly_hours = core::Decimal::from_int(Config::Default::STANDARD_WEEKLY_HOURS);
        input.weekly_hours = input.standard_weekly_hours;
        input.base_days = core::Decimal::from_int(Config::Default::BASE_VACATION_DAYS);
        if (argc >= 8) {
            auto hours = core::Decimal::parse(argv[7]);
            if (!hours) {
                print_usage();
                return 1;
            }
            input.weekly_hours = *hours;
        }
        if (argc >= 9) {
            auto days = core::Decimal::parse(argv[8]);
            if (!days) {
                print_usage();
                return 1;
            }
            input.base_days = *days;
        }

        auto output = svc.assign_vacation(employee, input);
        if (!output) return 2;
        std::cout << "months\t" << output->months_employed << std::endl;
        std::cout << "prorated\t" << output->prorated_entitlement.to_string() << std::endl;
        std::cout << "entitlement\t" << output->total_entitlement.to_string() << std::endl;
        return 0;
    }

    if (command == "close-year" || command == "reopen-year") {
        int year = 0;
        auto kind = argc >= 5 ? core::parse_account_kind(argv[4]) : std::nullopt;
        if (argc < 6 || !kind || !parse_int(argv[5], year)) {
            print_usage();
            return 1;
        }

        auto status = command == "close-year" ? svc.close_year(employee, *kind, year)
                                              : svc.reopen_year(employee, *kind, year);
        if (!status) return 1;
        std::cout << core::to_string(*status) << std::endl;
        return *status == core::TransitionStatus::Ok ? 0 : 2;
    }

    print_usage();
    return 1;
}
