#include "AUG-CLI_Validator.hpp"
#include "AUG-CLI_Device.hpp"

#include <QFileInfo>

#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

void Validator::validateConfig(const AugmentConfig& config) {
  if (config.imagesInputPath.empty()) {
    throw std::runtime_error("Images input path is empty. Set 'imagesInputPath' or pass --input.");
  }

  if (!QFileInfo(QString::fromStdString(config.imagesInputPath)).isDir()) {
    throw std::runtime_error("Images input path is not a directory: " + config.imagesInputPath);
  }

  if (config.imgPrefix.empty()) {
    throw std::runtime_error("Image prefix is empty. Set 'imgPrefix' (e.g. \"img.nrrd\").");
  }

  if (config.mode == BatchMode::PROCESS && config.outputPath.empty()) {
    throw std::runtime_error("Output path is empty. Set 'outputPath' or pass --output.");
  }

  if (config.mode == BatchMode::PREVIEW && config.previewPath.empty()) {
    throw std::runtime_error("Preview path is empty. Set 'previewPath'.");
  }

  if (config.filesStructure == FilesStructure::UNKNOWN) {
    throw std::runtime_error("Unknown files structure");
  }

  if (!config.transforms.is_array() || config.transforms.empty()) {
    throw std::runtime_error("No transformations configured. Add at least one entry to 'transforms'.");
  }

  // Throws on an unparseable selector
  Device::fromSelector(config.device);
}

//===================================================================================================================//

void Validator::validateCollectedImagesAndMasks(const std::vector<std::string>& imgs,
                                                const std::vector<std::string>& masks) {
  if (imgs.empty()) {
    throw std::runtime_error("No images found. Check the input path and image prefix.");
  }

  if (!masks.empty() && masks.size() != imgs.size()) {
    throw std::runtime_error("Number of images (" + std::to_string(imgs.size()) + ") and masks (" +
                             std::to_string(masks.size()) + ") do not match.");
  }
}
