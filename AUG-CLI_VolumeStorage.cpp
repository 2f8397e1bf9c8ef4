#include "AUG-CLI_VolumeStorage.hpp"
#include "AUG-CLI_VolumeLoader.hpp"

#include <QDir>

#include <iostream>
#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

VolumeStorage::VolumeStorage(std::string outputPath, const std::string& imgPrefix, const std::string& maskPrefix,
                             LogLevel logLevel)
    : outputPath(std::move(outputPath)), logLevel(logLevel) {
  this->imgParts = CaseCollector::splitPrefix(imgPrefix);
  this->maskParts = CaseCollector::splitPrefix(maskPrefix.empty() ? std::string("mask") : maskPrefix);
}

//===================================================================================================================//

std::string VolumeStorage::outputRoot(const std::string& outputPath) {
  return QDir(QString::fromStdString(outputPath)).filePath(OUTPUT_DIR).toStdString();
}

std::string VolumeStorage::makeDir(const std::string& outputPath, const std::string& caseName,
                                   const std::string& transformName) {
  QDir rootDir(QString::fromStdString(outputRoot(outputPath)));
  QString dirPath = rootDir.filePath(QString::fromStdString(caseName) + "/" + QString::fromStdString(transformName));

  if (!QDir().mkpath(dirPath)) {
    throw std::runtime_error("Failed to create output directory: " + dirPath.toStdString());
  }

  return dirPath.toStdString();
}

//===================================================================================================================//

// Sample type from the source file; geometry from the transformed volume when it has one spacing per axis.
static VolumeMetadata outputMetadata(const Volume& volume, const VolumeMetadata& source) {
  const VolumeMetadata& carried = volume.metadata();
  if (carried.spacing.size() != volume.ndim()) return source;

  VolumeMetadata metadata = carried;
  metadata.componentType = source.componentType;
  return metadata;
}

//===================================================================================================================//

void VolumeStorage::consume(const CaseUnit& unit) {
  QDir currentDir(QString::fromStdString(makeDir(this->outputPath, unit.identity.caseName, unit.transformName)));

  if (this->cachedImagePath != unit.identity.imagePath) {
    this->cachedImageMetadata = VolumeLoader::readMetadata(unit.identity.imagePath);
    // Intensity transforms leave the integer range of the source; masks keep their label type
    if (this->cachedImageMetadata.componentType != "double") this->cachedImageMetadata.componentType = "float";
    this->cachedImagePath = unit.identity.imagePath;
  }

  std::string imgPath = currentDir.filePath(QString::fromStdString(this->imgParts.fileName())).toStdString();
  Volume image = unit.image.to(Device::cpu());
  VolumeLoader::saveVolume(image, imgPath, outputMetadata(image, this->cachedImageMetadata));
  this->filesWritten++;

  if (this->logLevel >= LogLevel::DEBUG) std::cout << "Saved: " << imgPath << "\n";

  if (!unit.mask.has_value() || !unit.identity.maskPath.has_value()) return;

  if (this->cachedMaskPath != unit.identity.maskPath.value()) {
    this->cachedMaskMetadata = VolumeLoader::readMetadata(unit.identity.maskPath.value());
    this->cachedMaskPath = unit.identity.maskPath.value();
  }

  std::string maskPath = currentDir.filePath(QString::fromStdString(this->maskParts.fileName())).toStdString();
  Volume mask = unit.mask->to(Device::cpu());
  VolumeLoader::saveVolume(mask, maskPath, outputMetadata(mask, this->cachedMaskMetadata));
  this->filesWritten++;

  if (this->logLevel >= LogLevel::DEBUG) std::cout << "Saved: " << maskPath << "\n";
}
