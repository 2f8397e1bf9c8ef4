#ifndef AUG_CLI_TRANSFORMCLASSIFIER_HPP
#define AUG_CLI_TRANSFORMCLASSIFIER_HPP

#include "AUG-CLI_Transform.hpp"

#include <string>

//===================================================================================================================//

namespace AUG_CLI {

class TransformClassifier {
  public:
    static TransformKind classify(const TransformEntry& entry);

    // Name used for output folders and preview nodes. Prefers transformInfo()["class"], falls back
    // to the sanitized C++ type name.
    static std::string nameOf(const TransformEntry& entry);
    static std::string nameOf(const Transform& transform);

    // "AUG_CLI::RandFlipTransform<float>" -> "RandFlip". Never returns an empty string.
    static std::string sanitizeTransformName(const std::string& typeName);

    static std::string kindToName(TransformKind kind);

  private:
    static std::string demangle(const char* mangledName);
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_TRANSFORMCLASSIFIER_HPP
