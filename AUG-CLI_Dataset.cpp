#include "AUG-CLI_Dataset.hpp"
#include "AUG-CLI_TransformClassifier.hpp"
#include "AUG-CLI_VolumeLoader.hpp"

#include <stdexcept>

namespace AUG_CLI {

//===================================================================================================================//

AugmentationDataset::AugmentationDataset(std::vector<std::string> imgPaths, std::vector<std::string> maskPaths,
                                         Transformations transformations, Device device,
                                         VolumeSource volumeSource)
    : imgPaths(std::move(imgPaths)), maskPaths(std::move(maskPaths)), transformations(std::move(transformations)),
      device(device), volumeSource(std::move(volumeSource)) {
  if (!this->volumeSource) {
    this->volumeSource = &VolumeLoader::load;
  }
}

//===================================================================================================================//

CaseOutput AugmentationDataset::getCase(ulong idx) const {
  if (idx >= this->imgPaths.size()) {
    throw std::out_of_range("Case index " + std::to_string(idx) + " out of range (" +
                            std::to_string(this->imgPaths.size()) + " cases)");
  }

  CaseOutput output;

  std::optional<Volume> img = this->volumeSource(this->imgPaths[idx]);
  std::optional<Volume> mask;

  if (!this->maskPaths.empty() && idx < this->maskPaths.size()) {
    mask = this->volumeSource(this->maskPaths[idx]);
  }

  // Volumes are placed on the run device before any transform executes
  if (img.has_value()) img = img->to(this->device);
  if (mask.has_value()) mask = mask->to(this->device);

  for (const auto& entry : this->transformations) {
    switch (TransformClassifier::classify(entry)) {
      case TransformKind::RANDOMIZABLE:
        if (img.has_value() && mask.has_value()) {
          this->applyDictTransform(entry, {{IMAGE_KEY, img.value()}, {MASK_KEY, mask.value()}},
                                   output.transformedImages, &output.transformedMasks);
        } else if (img.has_value()) {
          this->applyDictTransform(entry, {{IMAGE_KEY, img.value()}}, output.transformedImages, nullptr);
        }
        break;

      case TransformKind::DETERMINISTIC:
        // Image and mask are transformed by two independent calls
        if (img.has_value()) {
          this->applyTransform(entry, img.value(), output.transformedImages);
        }
        if (mask.has_value()) {
          this->applyTransform(entry, mask.value(), output.transformedMasks);
        }
        break;
    }
  }

  return output;
}

//===================================================================================================================//

void AugmentationDataset::applyDictTransform(const TransformEntry& entry, VolumeDict data,
                                             TransformResults& transformedImages,
                                             TransformResults* transformedMasks) const {
  std::string transformName = TransformClassifier::nameOf(entry);
  VolumeDict transformed = entry.randomizable()(data);

  auto imgIt = transformed.find(IMAGE_KEY);
  if (imgIt == transformed.end()) {
    throw std::runtime_error("Transform '" + transformName + "' did not return an '" + IMAGE_KEY + "' volume");
  }
  transformedImages.emplace_back(transformName, imgIt->second.to(this->device));

  if (transformedMasks != nullptr) {
    auto maskIt = transformed.find(MASK_KEY);
    if (maskIt == transformed.end()) {
      throw std::runtime_error("Transform '" + transformName + "' did not return a '" + MASK_KEY + "' volume");
    }
    transformedMasks->emplace_back(transformName, maskIt->second.to(this->device));
  }
}

//===================================================================================================================//

void AugmentationDataset::applyTransform(const TransformEntry& entry, const Volume& volume,
                                         TransformResults& transformedList) const {
  std::string transformName = TransformClassifier::nameOf(entry);
  Volume transformed = entry.deterministic()(volume);
  transformedList.emplace_back(transformName, transformed.to(this->device));
}

//===================================================================================================================//

} // namespace AUG_CLI
