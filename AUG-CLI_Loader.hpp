#ifndef AUG_CLI_LOADER_HPP
#define AUG_CLI_LOADER_HPP

#include "AUG-CLI_AugmentConfig.hpp"

#include <json.hpp>

#include <string>

namespace AUG_CLI {

class Loader {
public:
  // Load the augmentation configuration with optional CLI overrides.
  // Relative paths in the file resolve against the config file's directory.
  static AugmentConfig loadConfig(const std::string& configFilePath, const ConfigOverrides& overrides = {});

  // Parse an already-read JSON document (paths resolve against baseDirPath).
  static AugmentConfig parseConfig(const nlohmann::json& json, const std::string& baseDirPath,
                                   const ConfigOverrides& overrides = {});

private:
  static nlohmann::json readJson(const std::string& filePath);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_LOADER_HPP
