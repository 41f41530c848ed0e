// Ticket: 0001_event_store_data_model

#include "calbal-ledger/src/DataTypes/Calendar.hpp"

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

using std::chrono::days;
using std::chrono::sys_days;

namespace
{

// Reads exactly `width` decimal digits starting at `pos`
int readDigits(std::string_view text,
               std::size_t pos,
               std::size_t width,
               const char* field)
{
  if (pos + width > text.size())
  {
    throw ValidationError{field, "truncated value '" + std::string{text} + "'"};
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i)
  {
    char const c = text[i];
    if (c < '0' || c > '9')
    {
      throw ValidationError{field,
                            "malformed value '" + std::string{text} + "'"};
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

void expectChar(std::string_view text,
                std::size_t pos,
                std::string_view allowed,
                const char* field)
{
  if (pos >= text.size() || allowed.find(text[pos]) == std::string_view::npos)
  {
    throw ValidationError{field, "malformed value '" + std::string{text} + "'"};
  }
}

Date parseDatePrefix(std::string_view text, const char* field)
{
  int const y = readDigits(text, 0, 4, field);
  expectChar(text, 4, "-", field);
  int const m = readDigits(text, 5, 2, field);
  expectChar(text, 7, "-", field);
  int const d = readDigits(text, 8, 2, field);

  Date const date{std::chrono::year{y},
                  std::chrono::month{static_cast<unsigned>(m)},
                  std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok())
  {
    throw ValidationError{field,
                          "no such calendar date '" + std::string{text} + "'"};
  }
  return date;
}

}  // namespace

Date localDate(Timestamp t, std::chrono::minutes utcOffset)
{
  return Date{std::chrono::floor<days>(t + utcOffset)};
}

Timestamp localDayStart(Date d, std::chrono::minutes utcOffset)
{
  return Timestamp{sys_days{d}} - utcOffset;
}

TimeRange localDayRange(Date d, std::chrono::minutes utcOffset)
{
  Timestamp const start = localDayStart(d, utcOffset);
  return TimeRange{start, start + days{1}};
}

TimeRange localRange(const DateRange& range, std::chrono::minutes utcOffset)
{
  return TimeRange{localDayStart(range.first, utcOffset),
                   localDayStart(range.last, utcOffset) + days{1}};
}

std::chrono::seconds localTimeOfDay(Timestamp t,
                                    std::chrono::minutes utcOffset)
{
  auto const local = t + utcOffset;
  return local - std::chrono::floor<days>(local);
}

unsigned localHour(Timestamp t, std::chrono::minutes utcOffset)
{
  return static_cast<unsigned>(
    std::chrono::floor<std::chrono::hours>(localTimeOfDay(t, utcOffset))
      .count());
}

IsoWeek isoWeekOf(Date d)
{
  sys_days const day{d};
  std::chrono::weekday const wd{day};
  sys_days const monday = day - days{wd.iso_encoding() - 1};
  Date const thursday{monday + days{3}};

  sys_days const jan1{thursday.year() / std::chrono::January / 1};
  auto const ordinal = (sys_days{thursday} - jan1).count();

  IsoWeek week;
  week.year = static_cast<int>(thursday.year());
  week.week = static_cast<unsigned>(ordinal / 7 + 1);
  week.monday = Date{monday};
  week.sunday = Date{monday + days{6}};
  return week;
}

Date firstOfMonth(Date d)
{
  return d.year() / d.month() / 1;
}

Date lastOfMonth(Date d)
{
  return Date{d.year() / d.month() / std::chrono::last};
}

Date addDays(Date d, int count)
{
  return Date{sys_days{d} + days{count}};
}

int daysBetweenInclusive(Date from, Date to)
{
  auto const span = (sys_days{to} - sys_days{from}).count();
  return span < 0 ? 0 : static_cast<int>(span) + 1;
}

std::string formatDate(Date d)
{
  return fmt::format("{:04d}-{:02d}-{:02d}",
                     static_cast<int>(d.year()),
                     static_cast<unsigned>(d.month()),
                     static_cast<unsigned>(d.day()));
}

std::string formatTimestamp(Timestamp t)
{
  auto const day = std::chrono::floor<days>(t);
  std::chrono::hh_mm_ss const tod{t - day};
  return fmt::format("{}T{:02d}:{:02d}:{:02d}Z",
                     formatDate(Date{day}),
                     tod.hours().count(),
                     tod.minutes().count(),
                     tod.seconds().count());
}

Date parseDate(std::string_view text)
{
  if (text.size() != 10)
  {
    throw ValidationError{"date",
                          "expected YYYY-MM-DD, got '" + std::string{text} +
                            "'"};
  }
  return parseDatePrefix(text, "date");
}

Timestamp parseTimestamp(std::string_view text)
{
  constexpr const char* kField = "event_timestamp";

  if (!text.empty() && text.back() == 'Z')
  {
    text.remove_suffix(1);
  }
  if (text.size() != 19)
  {
    throw ValidationError{kField,
                          "expected YYYY-MM-DDTHH:MM:SS, got '" +
                            std::string{text} + "'"};
  }

  Date const date = parseDatePrefix(text, kField);
  expectChar(text, 10, "T ", kField);
  int const hh = readDigits(text, 11, 2, kField);
  expectChar(text, 13, ":", kField);
  int const mm = readDigits(text, 14, 2, kField);
  expectChar(text, 16, ":", kField);
  int const ss = readDigits(text, 17, 2, kField);

  if (hh > 23 || mm > 59 || ss > 59)
  {
    throw ValidationError{kField,
                          "time of day out of range '" + std::string{text} +
                            "'"};
  }

  return Timestamp{sys_days{date}} + std::chrono::hours{hh} +
         std::chrono::minutes{mm} + std::chrono::seconds{ss};
}

}  // namespace calbal_ledger
