#include "AUG-CLI_BatchMode.hpp"

#include <stdexcept>

namespace AUG_CLI
{

  //===================================================================================================================//

  BatchMode batchModeFromString(const std::string& name)
  {
    if (name == "process")
      return BatchMode::PROCESS;

    if (name == "preview")
      return BatchMode::PREVIEW;
    throw std::runtime_error("Mode must be 'process' or 'preview' (got '" + name + "').");
  }

  //===================================================================================================================//

  std::string batchModeToString(BatchMode mode)
  {
    switch (mode) {
    case BatchMode::PROCESS:
      return "process";
    case BatchMode::PREVIEW:
      return "preview";
    }

    return "process";
  }

  //===================================================================================================================//

} // namespace AUG_CLI
