#ifndef AUG_CLI_VOLUMESTORAGE_HPP
#define AUG_CLI_VOLUMESTORAGE_HPP

#include "AUG-CLI_BatchDriver.hpp"
#include "AUG-CLI_CaseCollector.hpp"
#include "AUG-CLI_LogLevel.hpp"
#include "AUG-CLI_Volume.hpp"

#include <string>

//===================================================================================================================//

namespace AUG_CLI {

/**
 * Storage sink for process mode. Writes every unit to
 *
 *   <outputPath>/Augmentator/<case>/<transform>/<imgStem>.<imgExt>
 *   <outputPath>/Augmentator/<case>/<transform>/<maskStem>.<maskExt>
 *
 * copying the spatial metadata (and sample type) of the case's original image or mask.
 */
class VolumeStorage : public CaseSink {
  public:
    static constexpr const char* OUTPUT_DIR = "Augmentator";

    VolumeStorage(std::string outputPath, const std::string& imgPrefix, const std::string& maskPrefix,
                  LogLevel logLevel = LogLevel::INFO);

    void consume(const CaseUnit& unit) override;

    ulong getFilesWritten() const { return this->filesWritten; }

    // <outputPath>/Augmentator
    static std::string outputRoot(const std::string& outputPath);

    // Create (if needed) and return <outputPath>/Augmentator/<caseName>/<transformName>
    static std::string makeDir(const std::string& outputPath, const std::string& caseName,
                               const std::string& transformName);

  private:
    std::string outputPath;
    PrefixParts imgParts;
    PrefixParts maskParts;
    LogLevel logLevel;
    ulong filesWritten = 0;

    // Metadata of the last original files read (units of one case arrive together)
    std::string cachedImagePath;
    VolumeMetadata cachedImageMetadata;
    std::string cachedMaskPath;
    VolumeMetadata cachedMaskMetadata;
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_VOLUMESTORAGE_HPP
