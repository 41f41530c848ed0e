// Ticket: 0002_ledger_logging

#include "calbal-ledger/src/Logging/Logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace calbal_ledger
{

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name,
                                           spdlog::level::level_enum level)
{
  auto logger = spdlog::get(name);
  if (!logger)
  {
    try
    {
      logger = spdlog::stdout_color_mt(name);
    }
    catch (const spdlog::spdlog_ex&)
    {
      // Lost a registration race with another thread
      logger = spdlog::get(name);
      if (!logger)
      {
        throw;
      }
    }
  }
  logger->set_level(level);
  return logger;
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>(name, std::move(sink));
}

}  // namespace calbal_ledger
