// Ticket: 0009_daily_balance_aggregator

#ifndef CALBAL_LEDGER_AGGREGATION_KEYED_MUTEX_HPP
#define CALBAL_LEDGER_AGGREGATION_KEYED_MUTEX_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>

namespace calbal_ledger
{

/**
 * @brief One mutex per key, created on demand and released when unused
 *
 * Serializes work on the same key while letting distinct keys proceed in
 * parallel. Entries are reference counted so the map only holds keys with
 * a current holder or waiter.
 *
 * @tparam Key Ordered key type
 */
template <typename Key>
class KeyedMutex
{
  struct Entry
  {
    std::mutex mutex;
    size_t users{0};
  };

public:
  /**
   * @brief RAII ownership of one key
   */
  class Guard
  {
  public:
    Guard(KeyedMutex& owner, const Key& key) : owner_{&owner}, key_{key}
    {
      {
        std::scoped_lock lock{owner_->mapMutex_};
        auto& slot = owner_->entries_[key_];
        if (!slot)
        {
          slot = std::make_unique<Entry>();
        }
        ++slot->users;
        entry_ = slot.get();
      }
      entry_->mutex.lock();
    }

    ~Guard()
    {
      entry_->mutex.unlock();
      std::scoped_lock lock{owner_->mapMutex_};
      if (--entry_->users == 0)
      {
        owner_->entries_.erase(key_);
      }
    }

    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    Guard(Guard&&) = delete;
    Guard& operator=(Guard&&) = delete;

  private:
    KeyedMutex* owner_;
    Key key_;
    Entry* entry_{nullptr};
  };

  [[nodiscard]] size_t size() const
  {
    std::scoped_lock lock{mapMutex_};
    return entries_.size();
  }

private:
  mutable std::mutex mapMutex_;
  std::map<Key, std::unique_ptr<Entry>> entries_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_KEYED_MUTEX_HPP
