#ifndef AUG_CLI_AUGMENTCONFIG_HPP
#define AUG_CLI_AUGMENTCONFIG_HPP

#include "AUG-CLI_BatchMode.hpp"
#include "AUG-CLI_CaseCollector.hpp"

#include <json.hpp>

#include <optional>
#include <string>

#include <sys/types.h>

namespace AUG_CLI {

// Run configuration, read from the JSON config file with CLI overrides applied.
struct AugmentConfig {
  std::string imagesInputPath;
  std::string imgPrefix;
  std::string maskPrefix;  // Empty when cases have no mask
  std::string outputPath;
  std::string previewPath;
  FilesStructure filesStructure = FilesStructure::CASE_FOLDERS;
  std::string device = "CPU";  // Raw selector, parsed by Device::fromSelector
  BatchMode mode = BatchMode::PROCESS;
  std::optional<unsigned> seed;
  ulong progressReports = 1000;

  // Transform descriptors, parsed by TransformationParser
  nlohmann::json transforms = nlohmann::json::array();

  bool hasMasks() const { return !maskPrefix.empty(); }
};

// CLI values that take precedence over the config file.
struct ConfigOverrides {
  std::optional<std::string> mode;
  std::optional<std::string> imagesInputPath;
  std::optional<std::string> outputPath;
  std::optional<std::string> device;
  std::optional<unsigned> seed;
};

} // namespace AUG_CLI

#endif // AUG_CLI_AUGMENTCONFIG_HPP
