#ifndef AUG_CLI_DATASET_HPP
#define AUG_CLI_DATASET_HPP

#include "AUG-CLI_Device.hpp"
#include "AUG-CLI_Transform.hpp"
#include "AUG-CLI_Volume.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

using ulong = unsigned long;

// (transformName, transformed volume)
using TransformResult = std::pair<std::string, Volume>;
using TransformResults = std::vector<TransformResult>;

// Transformed volumes of one case, in transform configuration order.
struct CaseOutput {
    TransformResults transformedImages;
    TransformResults transformedMasks; // Empty when the case has no mask
};

// Reads a path into a volume; std::nullopt means "no volume".
using VolumeSource = std::function<std::optional<Volume>(const std::string&)>;

/**
 * AugmentationDataset: applies the configured transforms to every image/mask case.
 *
 * Randomizable transforms run once on {img, mask} so both share the same random draw.
 * Deterministic transforms run on the image and on the mask separately. Image and mask
 * lists are paired by index; an empty mask list means no case has a mask.
 */
class AugmentationDataset {
  public:
    AugmentationDataset(std::vector<std::string> imgPaths, std::vector<std::string> maskPaths,
                        Transformations transformations, Device device = Device::cpu(),
                        VolumeSource volumeSource = {});

    // Number of cases
    ulong size() const
    {
      return this->imgPaths.size();
    }

    // Load and transform case idx. Transform exceptions propagate to the caller.
    CaseOutput getCase(ulong idx) const;

    const Device& getDevice() const
    {
      return this->device;
    }

  private:
    std::vector<std::string> imgPaths;
    std::vector<std::string> maskPaths;
    Transformations transformations;
    Device device;
    VolumeSource volumeSource;

    // Randomizable transform on keyed volumes; appends to images and (when present) masks.
    void applyDictTransform(const TransformEntry& entry, VolumeDict data, TransformResults& transformedImages,
                            TransformResults* transformedMasks) const;

    // Deterministic transform on a single volume.
    void applyTransform(const TransformEntry& entry, const Volume& volume, TransformResults& transformedList) const;
};

} // namespace AUG_CLI

#endif // AUG_CLI_DATASET_HPP
