#ifndef AUG_CLI_LOGLEVEL_HPP
#define AUG_CLI_LOGLEVEL_HPP

#include <string>

//===================================================================================================================//

namespace AUG_CLI
{
  enum class LogLevel : int { QUIET = 0, ERROR = 1, WARNING = 2, INFO = 3, DEBUG = 4 };

  // Conversion helpers ("quiet", "error", "warning", "info", "debug")
  LogLevel logLevelFromString(const std::string& name);
  std::string logLevelToString(LogLevel level);
}

//===================================================================================================================//

#endif // AUG_CLI_LOGLEVEL_HPP
