// Ticket: 0011_recompute_queue

#include "calbal-ledger/src/Aggregation/RecomputeQueue.hpp"

#include <exception>

#include "calbal-ledger/src/Aggregation/DailyBalanceAggregator.hpp"

namespace calbal_ledger
{

RecomputeQueue::RecomputeQueue(DailyBalanceAggregator& aggregator,
                               uint32_t backfillMaxPerSecond,
                               std::shared_ptr<spdlog::logger> logger)
  : aggregator_{aggregator},
    backfillInterval_{backfillMaxPerSecond == 0
                        ? std::chrono::nanoseconds{0}
                        : std::chrono::nanoseconds{std::chrono::seconds{1}} /
                            backfillMaxPerSecond},
    logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"RecomputeQueue requires a logger"};
  }
  worker_ = std::jthread{[this](std::stop_token st)
                         { workerMain(std::move(st)); }};
}

RecomputeQueue::~RecomputeQueue()
{
  worker_.request_stop();
  workCv_.notify_all();
  if (worker_.joinable())
  {
    worker_.join();
  }

  std::scoped_lock lock{mutex_};
  if (!live_.empty() || !backfill_.empty())
  {
    logger_->warn("Recompute queue stopped with {} live and {} backfill keys "
                  "pending",
                  live_.size(),
                  backfill_.size());
  }
}

bool RecomputeQueue::schedule(BalanceKey key, RecomputeLane lane)
{
  {
    std::scoped_lock lock{mutex_};
    if (pendingLive_.contains(key))
    {
      return false;
    }
    if (lane == RecomputeLane::Backfill)
    {
      if (!pendingBackfill_.insert(key).second)
      {
        return false;
      }
      backfill_.push_back(std::move(key));
    }
    else
    {
      // A live request overtakes the same key waiting in the backfill lane;
      // the stale backfill entry is skipped when dequeued
      pendingBackfill_.erase(key);
      pendingLive_.insert(key);
      live_.push_back(std::move(key));
    }
  }
  workCv_.notify_one();
  return true;
}

void RecomputeQueue::drain()
{
  std::unique_lock lock{mutex_};
  idleCv_.wait(lock,
               [this]
               {
                 return stopped_ ||
                        (live_.empty() && backfill_.empty() && !running_);
               });
}

size_t RecomputeQueue::pending(RecomputeLane lane) const
{
  std::scoped_lock lock{mutex_};
  return lane == RecomputeLane::Live ? pendingLive_.size()
                                     : pendingBackfill_.size();
}

void RecomputeQueue::workerMain(std::stop_token stopToken)
{
  while (!stopToken.stop_requested())
  {
    BalanceKey key;
    {
      std::unique_lock lock{mutex_};
      if (!workCv_.wait(lock,
                        stopToken,
                        [this] { return !live_.empty() || !backfill_.empty(); }))
      {
        break;
      }

      if (live_.empty())
      {
        // Backfill only: honor the rate limit, but yield to live work that
        // arrives while waiting
        auto const now = std::chrono::steady_clock::now();
        if (now < nextBackfill_)
        {
          workCv_.wait_until(lock,
                             stopToken,
                             nextBackfill_,
                             [this] { return !live_.empty(); });
          continue;
        }

        key = std::move(backfill_.front());
        backfill_.pop_front();
        if (!pendingBackfill_.erase(key))
        {
          // Promoted to the live lane meanwhile
          if (live_.empty() && backfill_.empty())
          {
            idleCv_.notify_all();
          }
          continue;
        }
        nextBackfill_ = now + backfillInterval_;
      }
      else
      {
        key = std::move(live_.front());
        live_.pop_front();
        pendingLive_.erase(key);
      }
      running_ = true;
    }

    try
    {
      aggregator_.recompute(key.userId, key.date);
      ++completed_;
    }
    catch (const std::exception& e)
    {
      ++failures_;
      logger_->error("Queued recompute of {} {} failed: {}",
                     key.userId,
                     formatDate(key.date),
                     e.what());
    }

    {
      std::scoped_lock lock{mutex_};
      running_ = false;
    }
    idleCv_.notify_all();
  }

  // Unblock drain() callers on shutdown
  {
    std::scoped_lock lock{mutex_};
    stopped_ = true;
  }
  idleCv_.notify_all();
}

}  // namespace calbal_ledger
