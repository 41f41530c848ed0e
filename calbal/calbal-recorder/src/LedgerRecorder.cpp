// Ticket: 0016_ledger_journal

#include "calbal-recorder/src/LedgerRecorder.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <tuple>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"
#include "calbal-transfer/src/Records.hpp"

namespace calbal_recorder
{

using namespace calbal_ledger;
using namespace calbal_transfer;

namespace
{

double toNullable(const std::optional<double>& value)
{
  return value ? *value : std::numeric_limits<double>::quiet_NaN();
}

std::optional<double> fromNullable(double value)
{
  if (std::isnan(value))
  {
    return std::nullopt;
  }
  return value;
}

CalorieEvent toEvent(const CalorieEventRecord& record)
{
  CalorieEvent event;
  event.id = record.event_id;
  event.userId = record.user_id;
  event.type = parseEventType(record.event_type);
  event.timestamp = parseTimestamp(record.event_timestamp);
  event.value = record.value;
  event.source = parseEventSource(record.source);
  event.confidence = record.confidence_score;
  if (!record.supersedes.empty())
  {
    event.supersedes = record.supersedes;
  }
  return event;
}

CalorieGoalRecord toRecord(const CalorieGoal& goal)
{
  CalorieGoalRecord record{};
  record.goal_id = goal.id;
  record.user_id = goal.userId;
  record.goal_type = std::string{toString(goal.type)};
  record.daily_calorie_target = goal.dailyCalorieTarget;
  record.daily_deficit_target = toNullable(goal.dailyDeficitTarget);
  record.weekly_weight_change_kg = toNullable(goal.weeklyWeightChangeKg);
  record.start_date = formatDate(goal.startDate);
  record.end_date = goal.endDate ? formatDate(*goal.endDate) : std::string{};
  record.is_active = goal.isActive ? 1 : 0;
  record.ai_optimized = goal.aiOptimized ? 1 : 0;
  record.created_at = formatTimestamp(goal.createdAt);
  return record;
}

CalorieGoal toGoal(const CalorieGoalRecord& record)
{
  CalorieGoal goal;
  goal.id = record.goal_id;
  goal.userId = record.user_id;
  goal.type = parseGoalType(record.goal_type);
  goal.dailyCalorieTarget = record.daily_calorie_target;
  goal.dailyDeficitTarget = fromNullable(record.daily_deficit_target);
  goal.weeklyWeightChangeKg = fromNullable(record.weekly_weight_change_kg);
  goal.startDate = parseDate(record.start_date);
  if (!record.end_date.empty())
  {
    goal.endDate = parseDate(record.end_date);
  }
  goal.isActive = record.is_active != 0;
  goal.aiOptimized = record.ai_optimized != 0;
  goal.createdAt = parseTimestamp(record.created_at);
  return goal;
}

MetabolicProfileRecord toRecord(const MetabolicProfile& profile)
{
  MetabolicProfileRecord record{};
  record.user_id = profile.userId;
  record.version = profile.version;
  record.weight_kg = profile.inputs.weightKg;
  record.height_cm = profile.inputs.heightCm;
  record.gender = std::string{toString(profile.inputs.gender)};
  record.age_years = static_cast<uint32_t>(profile.inputs.ageYears);
  record.activity_level = std::string{toString(profile.inputs.activityLevel)};
  record.bmr_calories = profile.bmrCalories;
  record.tdee_calories = profile.tdeeCalories;
  record.rmr_calories = toNullable(profile.rmrCalories);
  record.calculation_method = profile.calculationMethod;
  record.accuracy_score = profile.accuracyScore;
  record.multiplier_sedentary = profile.activityMultipliers[0];
  record.multiplier_light = profile.activityMultipliers[1];
  record.multiplier_moderate = profile.activityMultipliers[2];
  record.multiplier_high = profile.activityMultipliers[3];
  record.multiplier_extreme = profile.activityMultipliers[4];
  record.ai_adjusted = profile.aiAdjusted ? 1 : 0;
  record.adjustment_factor = profile.adjustmentFactor;
  record.calculated_at = formatTimestamp(profile.calculatedAt);
  record.expires_at = formatTimestamp(profile.expiresAt);
  record.is_active = profile.isActive ? 1 : 0;
  return record;
}

MetabolicProfile toProfile(const MetabolicProfileRecord& record)
{
  MetabolicProfile profile;
  profile.userId = record.user_id;
  profile.version = record.version;
  profile.inputs.weightKg = record.weight_kg;
  profile.inputs.heightCm = record.height_cm;
  profile.inputs.gender = parseGender(record.gender);
  profile.inputs.ageYears = static_cast<int>(record.age_years);
  profile.inputs.activityLevel = parseActivityLevel(record.activity_level);
  profile.bmrCalories = record.bmr_calories;
  profile.tdeeCalories = record.tdee_calories;
  profile.rmrCalories = fromNullable(record.rmr_calories);
  profile.calculationMethod = record.calculation_method;
  profile.accuracyScore = record.accuracy_score;
  profile.activityMultipliers = {record.multiplier_sedentary,
                                 record.multiplier_light,
                                 record.multiplier_moderate,
                                 record.multiplier_high,
                                 record.multiplier_extreme};
  profile.aiAdjusted = record.ai_adjusted != 0;
  profile.adjustmentFactor = record.adjustment_factor;
  profile.calculatedAt = parseTimestamp(record.calculated_at);
  profile.expiresAt = parseTimestamp(record.expires_at);
  profile.isActive = record.is_active != 0;
  return profile;
}

DailyBalanceRecord toRecord(const DailyBalance& balance)
{
  DailyBalanceRecord record{};
  record.user_id = balance.userId;
  record.date = formatDate(balance.date);
  record.calories_consumed = balance.caloriesConsumed;
  record.calories_burned_exercise = balance.caloriesBurnedExercise;
  record.calories_burned_bmr = balance.caloriesBurnedBmr;
  record.net_calories = balance.netCalories();
  record.morning_weight = toNullable(balance.morningWeight);
  record.evening_weight = toNullable(balance.eveningWeight);
  record.daily_calorie_target = toNullable(balance.dailyCalorieTarget);
  record.goal_id = balance.goalId.value_or(0);
  record.events_count = balance.eventsCount;
  record.last_event_timestamp = balance.lastEventTimestamp
                                  ? formatTimestamp(*balance.lastEventTimestamp)
                                  : std::string{};
  record.data_completeness_score = balance.dataCompletenessScore;
  record.version = balance.version;
  record.computed_at = formatTimestamp(balance.computedAt);
  return record;
}

DailyBalance toBalance(const DailyBalanceRecord& record)
{
  DailyBalance balance;
  balance.userId = record.user_id;
  balance.date = parseDate(record.date);
  balance.caloriesConsumed = record.calories_consumed;
  balance.caloriesBurnedExercise = record.calories_burned_exercise;
  balance.caloriesBurnedBmr = record.calories_burned_bmr;
  balance.morningWeight = fromNullable(record.morning_weight);
  balance.eveningWeight = fromNullable(record.evening_weight);
  balance.dailyCalorieTarget = fromNullable(record.daily_calorie_target);
  if (record.goal_id != 0)
  {
    balance.goalId = record.goal_id;
  }
  balance.eventsCount = record.events_count;
  if (!record.last_event_timestamp.empty())
  {
    balance.lastEventTimestamp = parseTimestamp(record.last_event_timestamp);
  }
  balance.dataCompletenessScore = record.data_completeness_score;
  balance.version = record.version;
  balance.computedAt = parseTimestamp(record.computed_at);
  return balance;
}

}  // namespace

LedgerRecorder::LedgerRecorder(const Config& config,
                               std::shared_ptr<spdlog::logger> logger)
  : flushInterval_{config.flushInterval}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"LedgerRecorder requires a logger"};
  }

  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // Pre-create every DAO before the flush thread starts iterating them.
  // Event records first for FK integrity of their metadata.
  auto& eventDAO = database_->getDAO<CalorieEventRecord>();
  database_->getDAO<EventMetadataRecord>();
  database_->getDAO<CalorieGoalRecord>();
  database_->getDAO<MetabolicProfileRecord>();
  database_->getDAO<DailyBalanceRecord>();

  // Continue numbering after the records of an existing journal
  uint32_t maxId = 0;
  for (const auto& record : eventDAO.selectAll())
  {
    maxId = std::max(maxId, static_cast<uint32_t>(record.id));
  }
  nextEventRecordId_ = maxId + 1;

  logger_->info("Journaling ledger to {} (flush every {} ms, {} events "
                "already journaled)",
                config.databasePath,
                flushInterval_.count(),
                maxId);

  recorderThread_ = std::jthread{[this](std::stop_token st)
                                 { recorderThreadMain(std::move(st)); }};
}

LedgerRecorder::~LedgerRecorder()
{
  // The wakeup flushes once more before the loop sees the stop request
  recorderThread_.request_stop();
}

void LedgerRecorder::onEventAppended(const CalorieEvent& event)
{
  uint32_t const recordId = nextEventRecordId_.fetch_add(1);

  CalorieEventRecord record{};
  record.id = recordId;
  record.event_id = event.id;
  record.user_id = event.userId;
  record.event_type = std::string{toString(event.type)};
  record.event_timestamp = formatTimestamp(event.timestamp);
  record.value = event.value;
  record.source = std::string{toString(event.source)};
  record.confidence_score = event.confidence;
  record.supersedes = event.supersedes.value_or(std::string{});
  database_->getDAO<CalorieEventRecord>().addToBuffer(record);

  auto& metadataDAO = database_->getDAO<EventMetadataRecord>();
  for (const auto& [key, value] : event.metadata)
  {
    EventMetadataRecord entry{};
    entry.key = key;
    entry.value = value;
    entry.event.id = recordId;
    metadataDAO.addToBuffer(entry);
  }
}

void LedgerRecorder::onBalanceUpserted(const DailyBalance& balance)
{
  database_->getDAO<DailyBalanceRecord>().addToBuffer(toRecord(balance));
}

void LedgerRecorder::onGoalChanged(const CalorieGoal& goal)
{
  database_->getDAO<CalorieGoalRecord>().addToBuffer(toRecord(goal));
}

void LedgerRecorder::onProfileCreated(const MetabolicProfile& profile)
{
  database_->getDAO<MetabolicProfileRecord>().addToBuffer(toRecord(profile));
}

void LedgerRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();
}

LedgerJournal LedgerRecorder::loadJournal()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();

  LedgerJournal journal;
  journal.events = loadEventsLocked();
  journal.goals = loadGoalsLocked();
  journal.profiles = loadProfilesLocked();
  logger_->info("Loaded journal: {} events, {} goals, {} profile versions",
                journal.events.size(),
                journal.goals.size(),
                journal.profiles.size());
  return journal;
}

std::vector<CalorieEvent> LedgerRecorder::loadEvents()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();
  return loadEventsLocked();
}

std::vector<CalorieGoal> LedgerRecorder::loadGoals()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();
  return loadGoalsLocked();
}

std::vector<MetabolicProfile> LedgerRecorder::loadProfiles()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();
  return loadProfilesLocked();
}

std::vector<DailyBalance> LedgerRecorder::loadBalances()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();

  std::map<std::tuple<std::string, std::string>, DailyBalanceRecord> latest;
  for (auto& record : database_->getDAO<DailyBalanceRecord>().selectAll())
  {
    auto key = std::make_tuple(record.user_id, record.date);
    auto const it = latest.find(key);
    if (it == latest.end() || it->second.version < record.version)
    {
      latest.insert_or_assign(std::move(key), std::move(record));
    }
  }

  std::vector<DailyBalance> balances;
  balances.reserve(latest.size());
  for (const auto& [key, record] : latest)
  {
    balances.push_back(toBalance(record));
  }
  return balances;
}

std::vector<CalorieEvent> LedgerRecorder::loadEventsLocked()
{
  std::map<uint32_t, std::map<std::string, std::string>> metadata;
  for (const auto& entry : database_->getDAO<EventMetadataRecord>().selectAll())
  {
    metadata[entry.event.id].insert_or_assign(entry.key, entry.value);
  }

  auto records = database_->getDAO<CalorieEventRecord>().selectAll();
  std::sort(records.begin(),
            records.end(),
            [](const CalorieEventRecord& lhs, const CalorieEventRecord& rhs)
            { return lhs.id < rhs.id; });

  std::vector<CalorieEvent> events;
  events.reserve(records.size());
  for (const auto& record : records)
  {
    CalorieEvent event = toEvent(record);
    auto const it = metadata.find(record.id);
    if (it != metadata.end())
    {
      event.metadata = it->second;
    }
    events.push_back(std::move(event));
  }
  return events;
}

std::vector<CalorieGoal> LedgerRecorder::loadGoalsLocked()
{
  auto records = database_->getDAO<CalorieGoalRecord>().selectAll();
  std::sort(records.begin(),
            records.end(),
            [](const CalorieGoalRecord& lhs, const CalorieGoalRecord& rhs)
            { return lhs.id < rhs.id; });

  // Later records of a goal id describe its later states
  std::map<uint32_t, CalorieGoal> latest;
  for (const auto& record : records)
  {
    latest.insert_or_assign(record.goal_id, toGoal(record));
  }

  std::vector<CalorieGoal> goals;
  goals.reserve(latest.size());
  for (auto& [id, goal] : latest)
  {
    goals.push_back(std::move(goal));
  }
  return goals;
}

std::vector<MetabolicProfile> LedgerRecorder::loadProfilesLocked()
{
  auto records = database_->getDAO<MetabolicProfileRecord>().selectAll();
  std::sort(
    records.begin(),
    records.end(),
    [](const MetabolicProfileRecord& lhs, const MetabolicProfileRecord& rhs)
    { return lhs.id < rhs.id; });

  std::vector<MetabolicProfile> profiles;
  profiles.reserve(records.size());
  for (const auto& record : records)
  {
    profiles.push_back(toProfile(record));
  }
  return profiles;
}

const cpp_sqlite::Database& LedgerRecorder::getDatabase() const
{
  return *database_;
}

void LedgerRecorder::recorderThreadMain(std::stop_token stopToken)
{
  std::mutex waitMutex;
  std::unique_lock waitLock{waitMutex};
  while (!stopToken.stop_requested())
  {
    // Nothing notifies wakeCv_ except a stop request, so this either times
    // out for the next periodic flush or returns early on shutdown
    wakeCv_.wait_for(waitLock,
                     stopToken,
                     flushInterval_,
                     [] { return false; });

    std::scoped_lock lock{flushMutex_};
    flushLocked();
  }
}

void LedgerRecorder::flushLocked()
{
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

}  // namespace calbal_recorder
