// Ticket: 0010_recompute_retry

#ifndef CALBAL_LEDGER_AGGREGATION_RETRY_HPP
#define CALBAL_LEDGER_AGGREGATION_RETRY_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <thread>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

/**
 * @brief Backoff before retry number `attempt` (1-based)
 */
inline std::chrono::milliseconds backoffFor(const RetryPolicy& policy,
                                            uint32_t attempt)
{
  double delay = static_cast<double>(policy.initialBackoff.count());
  for (uint32_t i = 1; i < attempt; ++i)
  {
    delay *= policy.multiplier;
    if (delay >= static_cast<double>(policy.maxBackoff.count()))
    {
      return policy.maxBackoff;
    }
  }
  return std::min(
    std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(delay)},
    policy.maxBackoff);
}

/**
 * @brief Run `operation`, retrying TransientStorageError with backoff
 *
 * Any other exception propagates immediately. After the last attempt the
 * transient error itself propagates.
 *
 * @param what Short description used in log messages
 */
template <typename Operation>
auto withRetry(const RetryPolicy& policy,
               spdlog::logger& logger,
               std::string_view what,
               Operation&& operation) -> decltype(operation())
{
  uint32_t const attempts = std::max<uint32_t>(policy.maxAttempts, 1);
  for (uint32_t attempt = 1;; ++attempt)
  {
    try
    {
      return operation();
    }
    catch (const TransientStorageError& e)
    {
      if (attempt >= attempts)
      {
        logger.error("{} failed after {} attempts: {}", what, attempt, e.what());
        throw;
      }
      auto const delay = backoffFor(policy, attempt);
      logger.warn("{} attempt {} failed ({}); retrying in {} ms",
                  what,
                  attempt,
                  e.what(),
                  delay.count());
      std::this_thread::sleep_for(delay);
    }
  }
}

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_RETRY_HPP
