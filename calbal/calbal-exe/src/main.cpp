// Ticket: 0017_command_line_driver

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/Ledger/CalorieLedger.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"
#include "calbal-recorder/src/LedgerRecorder.hpp"

/**
 * @brief Command-line driver for the calorie-balance ledger
 *
 * Reads events from a CSV file with the columns
 *   user,type,timestamp,value,source,confidence[,id]
 * (a header line starting with "user" and lines starting with '#' are
 * skipped), then prints either the daily balances of every imported day,
 * one day (--date), or a rollup (--rollup).
 *
 * With --journal the ledger is first rebuilt from the SQLite journal and
 * every accepted change is journaled back. Rows without an id column get a
 * generated id, so re-importing them into the same journal duplicates
 * them.
 *
 * Usage: calbal <events.csv> [options]
 */

namespace
{

using namespace calbal_ledger;

struct Options
{
  std::string csvPath;
  std::optional<std::string> journalPath;
  std::optional<std::string> user;
  std::optional<Date> date;
  std::optional<RollupGranularity> granularity;
  std::optional<DateRange> rollupRange;
  std::optional<double> target;
  std::chrono::minutes utcOffset{0};
  bool verbose{false};
};

struct CsvRow
{
  size_t line{0};
  EventRequest request;
};

void printUsage(const char* program)
{
  std::cerr << "Usage: " << program << " <events.csv> [options]\n"
            << "Options:\n"
            << "  --journal <file.db>         replay and journal to SQLite\n"
            << "  --user <id>                 user to report on\n"
            << "  --date <YYYY-MM-DD>         print one daily balance\n"
            << "  --rollup <granularity> <from> <to>\n"
            << "                              hourly, daily, weekly, monthly "
               "or daily_balance_summary\n"
            << "  --target <kcal>             maintain_weight goal from the "
               "first imported day\n"
            << "  --utc-offset <minutes>      local time minus UTC\n"
            << "  --verbose                   debug logging\n";
}

Options parseOptions(int argc, char* argv[])
{
  if (argc < 2)
  {
    throw std::invalid_argument{"missing events file"};
  }

  Options options;
  options.csvPath = argv[1];

  auto next = [&](int& i, std::string_view flag) -> std::string
  {
    if (i + 1 >= argc)
    {
      throw std::invalid_argument{fmt::format("{} needs a value", flag)};
    }
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i)
  {
    std::string_view const flag = argv[i];
    if (flag == "--journal")
    {
      options.journalPath = next(i, flag);
    }
    else if (flag == "--user")
    {
      options.user = next(i, flag);
    }
    else if (flag == "--date")
    {
      options.date = parseDate(next(i, flag));
    }
    else if (flag == "--rollup")
    {
      options.granularity = parseRollupGranularity(next(i, flag));
      Date const from = parseDate(next(i, flag));
      Date const to = parseDate(next(i, flag));
      options.rollupRange = DateRange{from, to};
    }
    else if (flag == "--target")
    {
      options.target = std::stod(next(i, flag));
    }
    else if (flag == "--utc-offset")
    {
      options.utcOffset = std::chrono::minutes{std::stoi(next(i, flag))};
    }
    else if (flag == "--verbose")
    {
      options.verbose = true;
    }
    else
    {
      throw std::invalid_argument{fmt::format("unknown option {}", flag)};
    }
  }
  return options;
}

std::vector<std::string> splitCsvLine(const std::string& line)
{
  std::vector<std::string> fields;
  std::stringstream stream{line};
  std::string field;
  while (std::getline(stream, field, ','))
  {
    auto const first = field.find_first_not_of(" \t\r");
    auto const last = field.find_last_not_of(" \t\r");
    fields.push_back(first == std::string::npos
                       ? std::string{}
                       : field.substr(first, last - first + 1));
  }
  return fields;
}

EventRequest parseRow(const std::vector<std::string>& fields)
{
  if (fields.size() < 6 || fields.size() > 7)
  {
    throw ValidationError{
      "row", fmt::format("expected 6 or 7 columns, got {}", fields.size())};
  }

  EventRequest request;
  request.userId = fields[0];
  request.type = parseEventType(fields[1]);
  request.timestamp = parseTimestamp(fields[2]);
  try
  {
    request.value = std::stod(fields[3]);
    request.confidence = fields[5].empty() ? 1.0 : std::stod(fields[5]);
  }
  catch (const std::logic_error&)
  {
    throw ValidationError{"value", "not a number"};
  }
  request.source = parseEventSource(fields[4]);
  if (fields.size() == 7 && !fields[6].empty())
  {
    request.id = fields[6];
  }
  request.metadata.emplace("import", "csv");
  return request;
}

std::vector<CsvRow> readCsv(const std::string& path, size_t& rejected)
{
  std::ifstream file{path};
  if (!file)
  {
    throw std::runtime_error{fmt::format("cannot open {}", path)};
  }

  std::vector<CsvRow> rows;
  std::string line;
  size_t lineNumber = 0;
  while (std::getline(file, line))
  {
    ++lineNumber;
    if (line.empty() || line.front() == '#' || line.rfind("user", 0) == 0)
    {
      continue;
    }
    try
    {
      rows.push_back(CsvRow{lineNumber, parseRow(splitCsvLine(line))});
    }
    catch (const ValidationError& e)
    {
      ++rejected;
      std::cerr << path << ":" << lineNumber << ": " << e.field() << ": "
                << e.reason() << "\n";
    }
  }
  return rows;
}

std::string optionalText(const std::optional<double>& value)
{
  return value ? fmt::format("{:.1f}", *value) : std::string{"-"};
}

void printBalance(const DailyBalance& balance)
{
  std::cout << fmt::format(
    "{} {}  consumed {:.0f}  exercise {:.0f}  bmr {:.0f}  net {:.0f}  "
    "target {}  deviation {}  weight {}/{}  events {}  completeness {:.1f}  "
    "v{}\n",
    balance.userId,
    formatDate(balance.date),
    balance.caloriesConsumed,
    balance.caloriesBurnedExercise,
    balance.caloriesBurnedBmr,
    balance.netCalories(),
    optionalText(balance.dailyCalorieTarget),
    optionalText(balance.targetDeviation()),
    optionalText(balance.morningWeight),
    optionalText(balance.eveningWeight),
    balance.eventsCount,
    balance.dataCompletenessScore,
    balance.version);
}

// One line per rollup row, bucket first
struct RowPrinter
{
  void operator()(const HourlyRollup& row) const
  {
    std::cout << fmt::format("{} {:02}h  net {:.0f}  events {}  weight {}\n",
                             formatDate(row.date),
                             row.hour,
                             row.energy.net(),
                             row.eventCount,
                             optionalText(row.lastWeight));
  }

  void operator()(const DailyRollup& row) const
  {
    std::cout << fmt::format(
      "{}  consumed {:.0f}  burned {:.0f}  net {:.0f}  events {}  "
      "active hours {}  target {}\n",
      formatDate(row.date),
      row.energy.consumed,
      row.energy.totalBurned(),
      row.energy.net(),
      row.eventCount,
      row.activeHours,
      optionalText(row.goalTarget));
  }

  void operator()(const WeeklyRollup& row) const
  {
    std::cout << fmt::format(
      "{}-W{:02} ({}..{})  net {:.0f}  active days {}  avg consumed {:.0f}  "
      "weight {}->{}\n",
      row.isoYear,
      row.isoWeek,
      formatDate(row.weekStart),
      formatDate(row.weekEnd),
      row.energy.net(),
      row.activeDays,
      row.averageDailyConsumed,
      optionalText(row.weekStartWeight),
      optionalText(row.weekEndWeight));
  }

  void operator()(const MonthlyRollup& row) const
  {
    std::cout << fmt::format(
      "{}  net {:.0f}  active days {}  active weeks {}  avg weekly consumed "
      "{:.0f}  weight {}->{}\n",
      row.label,
      row.energy.net(),
      row.activeDays,
      row.activeWeeks,
      row.averageWeeklyConsumed,
      optionalText(row.monthStartWeight),
      optionalText(row.monthEndWeight));
  }

  void operator()(const BalanceSummaryRollup& row) const
  {
    std::string achieved = "-";
    if (row.goalAchieved)
    {
      achieved = *row.goalAchieved ? "yes" : "no";
    }
    std::cout << fmt::format(
      "{}  net {:.0f}  target {}  deviation {}  achieved {}  weight change "
      "{}  completeness {:.1f}\n",
      formatDate(row.date),
      row.energy.net(),
      optionalText(row.dailyCalorieTarget),
      optionalText(row.targetDeviation),
      achieved,
      optionalText(row.dailyWeightChange),
      row.dataCompletenessScore);
  }
};

std::string resolveUser(const Options& options,
                        const std::set<std::string>& users)
{
  if (options.user)
  {
    return *options.user;
  }
  if (users.size() != 1)
  {
    throw std::invalid_argument{
      fmt::format("{} users imported; choose one with --user", users.size())};
  }
  return *users.begin();
}

int run(const Options& options)
{
  auto logger = makeLogger(
    "calbal", options.verbose ? spdlog::level::debug : spdlog::level::warn);

  LedgerConfig config;
  config.utcOffset = options.utcOffset;
  config.loggerName = "calbal";
  CalorieLedger ledger{config, logger};

  std::shared_ptr<calbal_recorder::LedgerRecorder> recorder;
  if (options.journalPath)
  {
    calbal_recorder::LedgerRecorder::Config recorderConfig;
    recorderConfig.databasePath = *options.journalPath;
    recorder =
      std::make_shared<calbal_recorder::LedgerRecorder>(recorderConfig, logger);
    ledger.replay(recorder->loadJournal());
    ledger.addObserver(recorder);
  }

  size_t rejected = 0;
  auto const rows = readCsv(options.csvPath, rejected);

  std::map<std::string, DateRange> imported;
  for (const auto& row : rows)
  {
    Date const day = localDate(row.request.timestamp, config.utcOffset);
    auto [it, fresh] =
      imported.try_emplace(row.request.userId, DateRange{day, day});
    if (!fresh)
    {
      using std::chrono::sys_days;
      if (sys_days{day} < sys_days{it->second.first})
      {
        it->second.first = day;
      }
      if (sys_days{it->second.last} < sys_days{day})
      {
        it->second.last = day;
      }
    }
  }

  if (options.target)
  {
    for (const auto& [userId, range] : imported)
    {
      CalorieGoal goal;
      goal.userId = userId;
      goal.type = GoalType::MaintainWeight;
      goal.dailyCalorieTarget = *options.target;
      goal.startDate = range.first;
      ledger.createGoal(goal);
    }
  }

  size_t accepted = 0;
  for (const auto& row : rows)
  {
    try
    {
      ledger.postEvent(row.request);
      ++accepted;
    }
    catch (const ValidationError& e)
    {
      ++rejected;
      std::cerr << options.csvPath << ":" << row.line << ": " << e.field()
                << ": " << e.reason() << "\n";
    }
  }
  ledger.drain();
  std::cout << "Imported " << accepted << " events, rejected " << rejected
            << "\n";

  std::set<std::string> users;
  for (const auto& [userId, range] : imported)
  {
    users.insert(userId);
  }

  if (options.date)
  {
    std::string const userId = resolveUser(options, users);
    auto const balance = ledger.dailyBalance(userId, *options.date);
    if (!balance)
    {
      std::cout << "No events for " << userId << " on "
                << formatDate(*options.date) << "\n";
      return 0;
    }
    printBalance(*balance);
  }
  else if (options.granularity)
  {
    std::string const userId = resolveUser(options, users);
    auto const snapshot =
      ledger.rollup(userId, *options.granularity, *options.rollupRange);
    std::cout << toString(snapshot.granularity) << " rollup for " << userId
              << " at sequence " << snapshot.eventSequence << "\n";
    for (const auto& row : snapshot.rows)
    {
      std::visit(RowPrinter{}, row);
    }
  }
  else
  {
    for (const auto& [userId, range] : imported)
    {
      if (options.user && *options.user != userId)
      {
        continue;
      }
      for (const auto& balance : ledger.balances(userId, range))
      {
        printBalance(balance);
      }
    }
  }

  if (recorder)
  {
    recorder->flush();
  }
  return rejected == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[])
{
  try
  {
    return run(parseOptions(argc, argv));
  }
  catch (const calbal_ledger::ValidationError& e)
  {
    std::cerr << "Error: " << e.field() << ": " << e.reason() << "\n";
    return 1;
  }
  catch (const std::invalid_argument& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    printUsage(argv[0]);
    return 1;
  }
  catch (const std::exception& e)
  {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
