// Ticket: 0015_ledger_facade

#include "calbal-ledger/src/Ledger/CalorieLedger.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include <fmt/format.h>

#include "calbal-ledger/src/Aggregation/InMemoryBalanceStore.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/EventStore/EventValidator.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"

namespace calbal_ledger
{

namespace
{

// Marks the calling thread as the replaying one for the duration of
// CalorieLedger::replay
class ReplayScope
{
public:
  explicit ReplayScope(std::atomic<std::thread::id>& owner) : owner_{owner}
  {
    owner_ = std::this_thread::get_id();
  }

  ~ReplayScope()
  {
    owner_ = std::thread::id{};
  }

  ReplayScope(const ReplayScope&) = delete;
  ReplayScope& operator=(const ReplayScope&) = delete;
  ReplayScope(ReplayScope&&) = delete;
  ReplayScope& operator=(ReplayScope&&) = delete;

private:
  std::atomic<std::thread::id>& owner_;
};

std::optional<double> latestWeight(const std::vector<DailyBalance>& rows)
{
  for (auto it = rows.rbegin(); it != rows.rend(); ++it)
  {
    if (it->eveningWeight)
    {
      return it->eveningWeight;
    }
    if (it->morningWeight)
    {
      return it->morningWeight;
    }
  }
  return std::nullopt;
}

}  // namespace

template <typename Callback>
void CalorieLedger::notify(Callback&& callback)
{
  std::vector<std::shared_ptr<LedgerObserver>> observers;
  {
    std::scoped_lock lock{observerMutex_};
    observers = observers_;
  }
  for (const auto& observer : observers)
  {
    callback(*observer);
  }
}

CalorieLedger::CalorieLedger(LedgerConfig config,
                             std::shared_ptr<spdlog::logger> logger,
                             std::unique_ptr<BalanceStore> balances)
  : config_{std::move(config)},
    logger_{logger ? std::move(logger)
                   : makeLogger(config_.loggerName, config_.logLevel)}
{
  if (!config_.clock)
  {
    config_.clock = []
    {
      return std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    };
  }

  events_ = std::make_unique<InMemoryEventStore>(config_.limits, logger_);
  goals_ = std::make_unique<GoalManager>(config_.goalOverlapPolicy, logger_);
  profiles_ = std::make_unique<MetabolicProfileRegistry>(
    std::chrono::duration_cast<std::chrono::seconds>(config_.profileValidity),
    logger_);
  balances_ = balances ? std::move(balances)
                       : std::make_unique<InMemoryBalanceStore>();

  aggregator_ = std::make_unique<DailyBalanceAggregator>(
    *events_,
    *goals_,
    *balances_,
    DailyBalanceAggregator::Config{config_.utcOffset,
                                   config_.weightWindows,
                                   config_.retry,
                                   config_.clock},
    logger_);
  aggregator_->setUpsertListener(
    [this](const DailyBalance& row)
    {
      // Only the replay's own recomputes are silent; writers on other
      // threads keep notifying while a replay runs
      if (replayThread_.load() != std::this_thread::get_id())
      {
        notify([&row](LedgerObserver& observer)
               { observer.onBalanceUpserted(row); });
      }
    });

  rollups_ = std::make_unique<RollupEngine>(
    *events_,
    *goals_,
    RollupEngine::Config{
      config_.utcOffset, config_.weightWindows, config_.clock},
    logger_);
  cache_ = std::make_unique<RollupCache>(
    *rollups_, *events_, config_.rollupMaxStaleness);

  if (config_.recomputeMode == RecomputeMode::Queued)
  {
    queue_ = std::make_unique<RecomputeQueue>(
      *aggregator_, config_.backfillMaxPerSecond, logger_);
  }

  logger_->info("Calorie ledger ready: {} recompute, UTC offset {} min",
                queue_ ? "queued" : "synchronous",
                config_.utcOffset.count());
}

CalorieLedger::~CalorieLedger()
{
  if (queue_)
  {
    queue_->drain();
  }
}

// ----------------------------------------------------------------------------
// Events
// ----------------------------------------------------------------------------

CalorieEvent CalorieLedger::toEvent(const EventRequest& request)
{
  CalorieEvent event;
  event.id = request.id ? *request.id : idGenerator_.next();
  event.userId = request.userId;
  event.type = request.type;
  event.timestamp = request.timestamp;
  event.value = request.value;
  event.source = request.source;
  event.confidence = request.confidence;
  event.metadata = request.metadata;
  event.supersedes = request.supersedes;
  return event;
}

std::vector<BalanceKey> CalorieLedger::affectedKeys(
  const CalorieEvent& event) const
{
  std::vector<BalanceKey> keys{
    BalanceKey{event.userId, localDate(event.timestamp, config_.utcOffset)}};
  if (event.supersedes)
  {
    auto const original = events_->find(*event.supersedes);
    if (original)
    {
      BalanceKey originalKey{original->userId,
                             localDate(original->timestamp, config_.utcOffset)};
      if (originalKey != keys.front())
      {
        keys.push_back(std::move(originalKey));
      }
    }
  }
  return keys;
}

void CalorieLedger::schedule(const BalanceKey& key, RecomputeLane lane)
{
  if (queue_)
  {
    queue_->schedule(key, lane);
    return;
  }
  aggregator_->recompute(key.userId, key.date);
}

std::string CalorieLedger::postEvent(const EventRequest& request)
{
  CalorieEvent const event = toEvent(request);
  AppendResult const result = events_->append(event);

  CalorieEvent stored = event;
  if (result.inserted)
  {
    cache_->invalidate(event.userId);
    notify([&event](LedgerObserver& observer)
           { observer.onEventAppended(event); });
  }
  else if (auto existing = events_->find(result.eventId))
  {
    stored = std::move(*existing);
  }

  for (const auto& key : affectedKeys(stored))
  {
    schedule(key, RecomputeLane::Live);
  }
  return result.eventId;
}

void CalorieLedger::checkBatchCorrections(
  const std::vector<CalorieEvent>& events) const
{
  // Events of this batch that a later correction may name, by id
  std::map<std::string, const CalorieEvent*> earlier;
  // (user, corrected id) pairs claimed by corrections of this batch
  std::set<std::pair<std::string, std::string>> claimed;

  for (const auto& event : events)
  {
    // A re-submitted id is a no-op on append and skips these checks there
    if (earlier.contains(event.id) || events_->find(event.id))
    {
      continue;
    }

    if (event.supersedes)
    {
      const std::string& targetId = *event.supersedes;
      std::optional<CalorieEvent> target;
      if (auto const it = earlier.find(targetId); it != earlier.end())
      {
        target = *it->second;
      }
      else
      {
        target = events_->find(targetId);
      }

      if (!target || target->userId != event.userId)
      {
        throw ValidationError{
          "supersedes",
          fmt::format("event {} corrects '{}' which does not exist for this "
                      "user",
                      event.id,
                      targetId)};
      }
      if (target->type != event.type)
      {
        throw ValidationError{
          "supersedes",
          fmt::format("event {} must keep event type {}",
                      event.id,
                      toString(target->type))};
      }
      if (events_->supersededIds(event.userId).contains(targetId) ||
          !claimed.emplace(event.userId, targetId).second)
      {
        throw ValidationError{
          "supersedes",
          fmt::format("event '{}' is already superseded", targetId)};
      }
    }

    earlier.emplace(event.id, &event);
  }
}

std::vector<std::string> CalorieLedger::postEvents(
  std::span<const EventRequest> batch,
  RecomputeLane lane)
{
  EventValidator const validator{config_.limits};
  std::vector<CalorieEvent> events;
  events.reserve(batch.size());
  for (const auto& request : batch)
  {
    events.push_back(toEvent(request));
    validator.validate(events.back());
  }
  checkBatchCorrections(events);

  std::vector<std::string> ids;
  ids.reserve(events.size());
  std::set<BalanceKey> keys;
  size_t inserted = 0;
  try
  {
    for (const auto& event : events)
    {
      AppendResult const result = events_->append(event);
      ids.push_back(result.eventId);
      if (result.inserted)
      {
        ++inserted;
        cache_->invalidate(event.userId);
        notify([&event](LedgerObserver& observer)
               { observer.onEventAppended(event); });
      }
      for (auto& key : affectedKeys(event))
      {
        keys.insert(std::move(key));
      }
    }
  }
  catch (const ValidationError& error)
  {
    // A concurrent writer got in between the checks and the append. The
    // events already stored still need their days recomputed.
    logger_->error("Batch stopped after {} of {} events: {}",
                   ids.size(),
                   events.size(),
                   error.what());
    for (const auto& key : keys)
    {
      schedule(key, lane);
    }
    throw;
  }

  for (const auto& key : keys)
  {
    schedule(key, lane);
  }

  logger_->info("Stored {} of {} batch events; {} days scheduled on the {} "
                "lane",
                inserted,
                events.size(),
                keys.size(),
                lane == RecomputeLane::Live ? "live" : "backfill");
  return ids;
}

// ----------------------------------------------------------------------------
// Balances and rollups
// ----------------------------------------------------------------------------

std::optional<DailyBalance> CalorieLedger::dailyBalance(
  const std::string& userId,
  Date date)
{
  if (auto row = balances_->find(BalanceKey{userId, date}))
  {
    return row;
  }

  auto const dayEvents = events_->list(
    userId, std::nullopt, localDayRange(date, config_.utcOffset));
  if (dayEvents.empty())
  {
    return std::nullopt;
  }
  return aggregator_->recompute(userId, date);
}

std::vector<DailyBalance> CalorieLedger::balances(const std::string& userId,
                                                  const DateRange& dates) const
{
  return balances_->range(userId, dates);
}

RollupSnapshot CalorieLedger::rollup(const std::string& userId,
                                     RollupGranularity granularity,
                                     const DateRange& dates)
{
  return cache_->get(userId, granularity, dates);
}

bool CalorieLedger::isStale(const std::string& userId,
                            const RollupSnapshot& snapshot) const
{
  return cache_->isStale(userId, snapshot);
}

std::vector<DailyBalance> CalorieLedger::reaggregate(const std::string& userId,
                                                     const DateRange& dates)
{
  return aggregator_->reaggregate(userId, dates);
}

// ----------------------------------------------------------------------------
// Goals
// ----------------------------------------------------------------------------

uint32_t CalorieLedger::createGoal(CalorieGoal goal)
{
  if (goal.createdAt == Timestamp{})
  {
    goal.createdAt = now();
  }
  uint32_t const goalId = goals_->create(std::move(goal));
  if (auto stored = goals_->find(goalId))
  {
    notify([&stored](LedgerObserver& observer)
           { observer.onGoalChanged(*stored); });
  }
  return goalId;
}

uint32_t CalorieLedger::updateGoal(uint32_t goalId, CalorieGoal replacement)
{
  if (replacement.createdAt == Timestamp{})
  {
    replacement.createdAt = now();
  }
  uint32_t const newId = goals_->supersede(goalId, std::move(replacement));
  for (uint32_t const id : {goalId, newId})
  {
    if (auto stored = goals_->find(id))
    {
      notify([&stored](LedgerObserver& observer)
             { observer.onGoalChanged(*stored); });
    }
  }
  return newId;
}

void CalorieLedger::deactivateGoal(uint32_t goalId)
{
  goals_->deactivate(goalId);
  if (auto stored = goals_->find(goalId))
  {
    notify([&stored](LedgerObserver& observer)
           { observer.onGoalChanged(*stored); });
  }
}

std::optional<CalorieGoal> CalorieLedger::activeGoal(const std::string& userId,
                                                     Date date) const
{
  return goals_->resolveActive(userId, date);
}

std::vector<CalorieGoal> CalorieLedger::goals(const std::string& userId,
                                              bool activeOnly) const
{
  return goals_->goals(userId, activeOnly);
}

CalorieGoal CalorieLedger::planGoal(const std::string& userId,
                                    const GoalPlanRequest& request)
{
  auto const profile = profiles_->active(userId, now());
  if (!profile)
  {
    throw NotFoundError{
      fmt::format("No active metabolic profile for user {}", userId)};
  }

  uint32_t const goalId = createGoal(GoalPlanner::plan(*profile, request, now()));
  auto stored = goals_->find(goalId);
  if (!stored)
  {
    throw NotFoundError{fmt::format("Goal {} vanished after creation", goalId)};
  }
  return *stored;
}

// ----------------------------------------------------------------------------
// Metabolic profiles
// ----------------------------------------------------------------------------

MetabolicProfile CalorieLedger::calculateMetabolicProfile(
  const std::string& userId,
  const MetabolicInputs& inputs)
{
  MetabolicProfile profile = profiles_->calculate(userId, inputs, now());
  notify([&profile](LedgerObserver& observer)
         { observer.onProfileCreated(profile); });
  return profile;
}

MetabolicProfile CalorieLedger::adjustMetabolicProfile(
  const std::string& userId,
  double factor)
{
  MetabolicProfile profile = profiles_->applyAdjustment(userId, factor, now());
  notify([&profile](LedgerObserver& observer)
         { observer.onProfileCreated(profile); });
  return profile;
}

std::optional<MetabolicProfile> CalorieLedger::activeMetabolicProfile(
  const std::string& userId) const
{
  return profiles_->active(userId, now());
}

bool CalorieLedger::needsProfileRecalculation(
  const std::string& userId,
  const MetabolicInputs& inputs) const
{
  return profiles_->needsRecalculation(userId, inputs, now());
}

// ----------------------------------------------------------------------------
// Analytics
// ----------------------------------------------------------------------------

double CalorieLedger::targetOn(const std::string& userId, Date date) const
{
  auto const goal = goals_->resolveActive(userId, date);
  if (!goal)
  {
    throw NotFoundError{fmt::format(
      "No goal in force for user {} on {}", userId, formatDate(date))};
  }
  return goal->dailyCalorieTarget;
}

ProgressMetrics CalorieLedger::progress(const std::string& userId,
                                        const DateRange& dates)
{
  double const target = targetOn(userId, dates.last);
  auto const rows = balances_->range(userId, dates);
  return ProgressAnalytics::progressMetrics(rows, target);
}

WeightPrediction CalorieLedger::predictWeightChange(const std::string& userId,
                                                    const DateRange& dates)
{
  double const target = targetOn(userId, dates.last);
  auto const rows = balances_->range(userId, dates);
  return ProgressAnalytics::predictWeightChange(
    rows, target, latestWeight(rows));
}

// ----------------------------------------------------------------------------
// Journal and lifecycle
// ----------------------------------------------------------------------------

size_t CalorieLedger::replay(const LedgerJournal& journal)
{
  // Refuse a journal with dangling corrections before touching any state
  std::unordered_set<std::string> journaled;
  for (const auto& event : journal.events)
  {
    journaled.insert(event.id);
  }
  for (const auto& event : journal.events)
  {
    if (event.supersedes && !journaled.contains(*event.supersedes) &&
        !events_->find(*event.supersedes))
    {
      throw ValidationError{
        "supersedes",
        fmt::format("event {} corrects {} which is not in the journal",
                    event.id,
                    *event.supersedes)};
    }
  }

  ReplayScope const scope{replayThread_};

  for (const auto& goal : journal.goals)
  {
    goals_->restore(goal);
  }
  for (const auto& profile : journal.profiles)
  {
    profiles_->restore(profile);
  }

  // Corrections wait until the event they replace is stored
  std::deque<const CalorieEvent*> pending;
  for (const auto& event : journal.events)
  {
    pending.push_back(&event);
  }

  std::set<BalanceKey> touched;
  size_t inserted = 0;
  while (!pending.empty())
  {
    bool progressed = false;
    size_t const passSize = pending.size();
    for (size_t i = 0; i < passSize; ++i)
    {
      const CalorieEvent* event = pending.front();
      pending.pop_front();
      if (event->supersedes && !events_->find(*event->supersedes))
      {
        pending.push_back(event);
        continue;
      }

      progressed = true;
      if (events_->append(*event).inserted)
      {
        ++inserted;
      }
      for (auto& key : affectedKeys(*event))
      {
        touched.insert(std::move(key));
      }
    }

    if (!progressed)
    {
      throw ValidationError{
        "supersedes",
        fmt::format("{} journaled corrections form a cycle", pending.size())};
    }
  }

  for (const auto& key : touched)
  {
    aggregator_->recompute(key.userId, key.date);
  }

  logger_->info("Replayed {} events ({} new), {} goals and {} profiles; "
                "recomputed {} days",
                journal.events.size(),
                inserted,
                journal.goals.size(),
                journal.profiles.size(),
                touched.size());
  return inserted;
}

void CalorieLedger::drain()
{
  if (queue_)
  {
    queue_->drain();
  }
}

void CalorieLedger::addObserver(std::shared_ptr<LedgerObserver> observer)
{
  if (!observer)
  {
    throw std::invalid_argument{"CalorieLedger observer must not be null"};
  }
  std::scoped_lock lock{observerMutex_};
  observers_.push_back(std::move(observer));
}

void CalorieLedger::removeObserver(
  const std::shared_ptr<LedgerObserver>& observer)
{
  std::scoped_lock lock{observerMutex_};
  std::erase(observers_, observer);
}

uint64_t CalorieLedger::sequence(const std::string& userId) const
{
  return events_->sequence(userId);
}

}  // namespace calbal_ledger
