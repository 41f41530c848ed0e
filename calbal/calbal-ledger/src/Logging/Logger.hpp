// Ticket: 0002_ledger_logging

#ifndef CALBAL_LEDGER_LOGGING_LOGGER_HPP
#define CALBAL_LEDGER_LOGGING_LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace calbal_ledger
{

/**
 * @brief Get or create a colored stdout logger registered under `name`
 *
 * A logger already registered with spdlog under the same name is returned
 * as-is (with its level updated), so several ledgers in one process share
 * their sink.
 */
std::shared_ptr<spdlog::logger> makeLogger(
  const std::string& name,
  spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Unregistered logger that discards all output (tests, tooling)
 */
std::shared_ptr<spdlog::logger> makeNullLogger(
  const std::string& name = "calbal-null");

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_LOGGING_LOGGER_HPP
