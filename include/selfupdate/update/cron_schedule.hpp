#pragma once

#include "selfupdate/util/time_utils.hpp"

#include <optional>
#include <string_view>

namespace selfupdate {

// The recurrence rules a scheduled update may carry. Only the named periods
// and their five-field equivalents are understood:
//   @daily   | 0 0 * * *   next local midnight
//   @weekly  | 0 0 * * 0   next Sunday 00:00 (a week out when today is Sunday)
//   @monthly | 0 0 1 * *   the 1st of next month, 00:00
//   @yearly  | 0 0 1 1 *   January 1st of next year, 00:00
enum class CronPeriod { kDaily, kWeekly, kMonthly, kYearly };

std::optional<CronPeriod> ParseCronExpression(std::string_view expr);

const char* ToString(CronPeriod period);

// First trigger strictly after `after`, in local time.
TimePoint NextCronTime(CronPeriod period, TimePoint after);

} // namespace selfupdate
