#ifndef AUG_CLI_TRANSFORMATIONPARSER_HPP
#define AUG_CLI_TRANSFORMATIONPARSER_HPP

#include "AUG-CLI_Transform.hpp"

#include <json.hpp>

#include <optional>
#include <string>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

/**
 * Maps the "transforms" array of a configuration file onto transform objects, in order:
 *
 *   "transforms": [
 *     { "type": "RandRotate", "prob": 0.8, "range": 20 },
 *     { "type": "NormalizeIntensity" }
 *   ]
 *
 * When a seed is given, the i-th randomizable transform is seeded with seed + i so runs are
 * reproducible; otherwise every randomizable transform is seeded from std::random_device.
 */
class TransformationParser {
  public:
    static Transformations parse(const nlohmann::json& transformsJson, std::optional<unsigned int> seed = std::nullopt);

    // Names accepted in the "type" field
    static std::vector<std::string> supportedTypes();

  private:
    static TransformEntry parseTransform(const nlohmann::json& transformJson);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_TRANSFORMATIONPARSER_HPP
