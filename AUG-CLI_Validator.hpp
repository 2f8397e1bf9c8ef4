#ifndef AUG_CLI_VALIDATOR_HPP
#define AUG_CLI_VALIDATOR_HPP

#include "AUG-CLI_AugmentConfig.hpp"

#include <string>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// Rejects invalid runs before the dataset is built. Every check throws std::runtime_error.
class Validator {
  public:
    static void validateConfig(const AugmentConfig& config);

    static void validateCollectedImagesAndMasks(const std::vector<std::string>& imgs,
                                                const std::vector<std::string>& masks);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_VALIDATOR_HPP
