#include "selfupdate/update/cron_schedule.hpp"

#include <ctime>

namespace selfupdate {

namespace {

struct CronAlias {
    std::string_view expr;
    CronPeriod period;
};

constexpr CronAlias kCronTable[] = {
    {"@daily", CronPeriod::kDaily},     {"0 0 * * *", CronPeriod::kDaily},
    {"@weekly", CronPeriod::kWeekly},   {"0 0 * * 0", CronPeriod::kWeekly},
    {"@monthly", CronPeriod::kMonthly}, {"0 0 1 * *", CronPeriod::kMonthly},
    {"@yearly", CronPeriod::kYearly},   {"0 0 1 1 *", CronPeriod::kYearly},
};

} // namespace

std::optional<CronPeriod> ParseCronExpression(std::string_view expr) {
    for (const auto& alias : kCronTable) {
        if (alias.expr == expr) return alias.period;
    }
    return std::nullopt;
}

const char* ToString(CronPeriod period) {
    switch (period) {
        case CronPeriod::kDaily:   return "@daily";
        case CronPeriod::kWeekly:  return "@weekly";
        case CronPeriod::kMonthly: return "@monthly";
        case CronPeriod::kYearly:  return "@yearly";
    }
    return "?";
}

TimePoint NextCronTime(CronPeriod period, TimePoint after) {
    const std::time_t t = std::chrono::system_clock::to_time_t(after);
    std::tm tm{};
    localtime_r(&t, &tm);

    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    switch (period) {
        case CronPeriod::kDaily:
            tm.tm_mday += 1;
            break;
        case CronPeriod::kWeekly: {
            int days = (7 - tm.tm_wday) % 7;
            if (days == 0) days = 7;
            tm.tm_mday += days;
            break;
        }
        case CronPeriod::kMonthly:
            tm.tm_mday = 1;
            tm.tm_mon += 1;
            break;
        case CronPeriod::kYearly:
            tm.tm_mday = 1;
            tm.tm_mon = 0;
            tm.tm_year += 1;
            break;
    }
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

} // namespace selfupdate
