// Ticket: 0001_event_store_data_model

#ifndef CALBAL_LEDGER_DATA_TYPES_LEDGER_ERRORS_HPP
#define CALBAL_LEDGER_DATA_TYPES_LEDGER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace calbal_ledger
{

/**
 * @brief Input rejected before any state was touched
 *
 * Carries the offending field name and a human-readable reason so the
 * transport layer can map it onto a structured 4xx response.
 */
class ValidationError : public std::invalid_argument
{
public:
  ValidationError(std::string field, std::string reason)
    : std::invalid_argument{field + ": " + reason},
      field_{std::move(field)},
      reason_{std::move(reason)}
  {
  }

  [[nodiscard]] const std::string& field() const noexcept
  {
    return field_;
  }

  [[nodiscard]] const std::string& reason() const noexcept
  {
    return reason_;
  }

private:
  std::string field_;
  std::string reason_;
};

/**
 * @brief Lookup of an identifier that does not exist (goal id, profile owner)
 */
class NotFoundError : public std::out_of_range
{
public:
  using std::out_of_range::out_of_range;
};

/**
 * @brief Storage failure that is expected to succeed when retried
 *
 * Raised by BalanceStore backends on lost optimistic races or transient I/O
 * failures. The aggregator retries it with backoff.
 */
class TransientStorageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_DATA_TYPES_LEDGER_ERRORS_HPP
