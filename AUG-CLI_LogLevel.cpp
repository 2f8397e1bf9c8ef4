#include "AUG-CLI_LogLevel.hpp"

#include <stdexcept>

namespace AUG_CLI
{

  //===================================================================================================================//

  LogLevel logLevelFromString(const std::string& name)
  {
    if (name == "quiet")
      return LogLevel::QUIET;

    if (name == "error")
      return LogLevel::ERROR;

    if (name == "warning")
      return LogLevel::WARNING;

    if (name == "info")
      return LogLevel::INFO;

    if (name == "debug")
      return LogLevel::DEBUG;
    throw std::runtime_error("Unknown log level: '" + name + "'. Expected 'quiet', 'error', 'warning', 'info' or 'debug'.");
  }

  //===================================================================================================================//

  std::string logLevelToString(LogLevel level)
  {
    switch (level) {
    case LogLevel::QUIET:
      return "quiet";
    case LogLevel::ERROR:
      return "error";
    case LogLevel::WARNING:
      return "warning";
    case LogLevel::INFO:
      return "info";
    case LogLevel::DEBUG:
      return "debug";
    }

    return "info";
  }

  //===================================================================================================================//

} // namespace AUG_CLI
