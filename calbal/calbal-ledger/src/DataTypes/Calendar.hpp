// Ticket: 0001_event_store_data_model

#ifndef CALBAL_LEDGER_DATA_TYPES_CALENDAR_HPP
#define CALBAL_LEDGER_DATA_TYPES_CALENDAR_HPP

#include <chrono>
#include <string>
#include <string_view>

namespace calbal_ledger
{

/// Instant in UTC at second precision
using Timestamp = std::chrono::sys_seconds;

/// Civil (local) calendar date
using Date = std::chrono::year_month_day;

/**
 * @brief Half-open instant range [from, to)
 */
struct TimeRange
{
  Timestamp from;
  Timestamp to;

  [[nodiscard]] bool contains(Timestamp t) const
  {
    return from <= t && t < to;
  }

  [[nodiscard]] bool empty() const
  {
    return !(from < to);
  }
};

/**
 * @brief Inclusive date range [first, last]
 */
struct DateRange
{
  Date first;
  Date last;

  [[nodiscard]] bool contains(Date d) const
  {
    return std::chrono::sys_days{first} <= std::chrono::sys_days{d} &&
           std::chrono::sys_days{d} <= std::chrono::sys_days{last};
  }
};

/**
 * @brief ISO-8601 week identification
 *
 * The ISO year may differ from the calendar year of dates near
 * January 1st (2024-12-30 belongs to 2025-W01).
 */
struct IsoWeek
{
  int year{0};
  unsigned week{0};
  Date monday;
  Date sunday;
};

/**
 * @brief Local calendar date of an instant
 * @param utcOffset Local time minus UTC
 */
Date localDate(Timestamp t, std::chrono::minutes utcOffset);

/// Instant at which the local date begins
Timestamp localDayStart(Date d, std::chrono::minutes utcOffset);

/// Half-open instant window covering one local day
TimeRange localDayRange(Date d, std::chrono::minutes utcOffset);

/// Half-open instant window covering an inclusive local date range
TimeRange localRange(const DateRange& range, std::chrono::minutes utcOffset);

/// Local wall-clock time since local midnight
std::chrono::seconds localTimeOfDay(Timestamp t,
                                    std::chrono::minutes utcOffset);

/// Local hour-of-day in [0, 23]
unsigned localHour(Timestamp t, std::chrono::minutes utcOffset);

IsoWeek isoWeekOf(Date d);

Date firstOfMonth(Date d);
Date lastOfMonth(Date d);
Date addDays(Date d, int days);

/// Number of days in [from, to], zero when to < from
int daysBetweenInclusive(Date from, Date to);

/// "YYYY-MM-DD"
std::string formatDate(Date d);

/// "YYYY-MM-DDTHH:MM:SSZ"
std::string formatTimestamp(Timestamp t);

/**
 * @brief Parse "YYYY-MM-DD"
 * @throws ValidationError on malformed or impossible dates
 */
Date parseDate(std::string_view text);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS" with an optional trailing 'Z'
 *
 * A space is accepted in place of the 'T' separator.
 *
 * @throws ValidationError on malformed input
 */
Timestamp parseTimestamp(std::string_view text);

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_DATA_TYPES_CALENDAR_HPP
