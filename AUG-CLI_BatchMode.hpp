#ifndef AUG_CLI_BATCHMODE_HPP
#define AUG_CLI_BATCHMODE_HPP

#include <string>

namespace AUG_CLI {

// Whether results are persisted (process) or staged for inspection on the first case only (preview)
enum class BatchMode { PROCESS, PREVIEW };

// Conversion helpers
BatchMode batchModeFromString(const std::string& name);
std::string batchModeToString(BatchMode mode);

} // namespace AUG_CLI

#endif // AUG_CLI_BATCHMODE_HPP
