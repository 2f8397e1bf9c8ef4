#include "AUG-CLI_SlicePreviewer.hpp"
#include "AUG-CLI_VolumeLoader.hpp"

#include <QDir>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

SlicePreviewer::SlicePreviewer(std::string previewPath, LogLevel logLevel)
    : previewPath(std::move(previewPath)), logLevel(logLevel) {}

//===================================================================================================================//

void SlicePreviewer::beginBatch() {
  QDir dir(QString::fromStdString(this->previewPath));

  if (dir.exists()) {
    for (const QString& fileName : dir.entryList({"*.png"}, QDir::Files)) {
      if (!dir.remove(fileName)) {
        throw std::runtime_error("Failed to clear preview file: " + dir.filePath(fileName).toStdString());
      }
    }
  } else if (!QDir().mkpath(dir.path())) {
    throw std::runtime_error("Failed to create preview directory: " + this->previewPath);
  }

  this->nodeNames.clear();
}

//===================================================================================================================//

std::string SlicePreviewer::nodePath(const std::string& nodeName) const {
  return QDir(QString::fromStdString(this->previewPath)).filePath(QString::fromStdString(nodeName) + ".png")
    .toStdString();
}

//===================================================================================================================//

void SlicePreviewer::consume(const CaseUnit& unit) {
  this->showNode(unit.imageNodeName, unit.image);

  if (unit.mask.has_value()) {
    this->showNode(unit.maskNodeName, unit.mask.value());
  }
}

//===================================================================================================================//

void SlicePreviewer::showNode(const std::string& nodeName, const Volume& volume) {
  Volume cpuVolume = volume.to(Device::cpu());
  VolumeLoader::saveSlice(cpuVolume, this->nodePath(nodeName));
  this->nodeNames.push_back(nodeName);

  if (this->logLevel >= LogLevel::INFO) {
    std::ostringstream out;
    out << "Preview " << nodeName << ": shape " << cpuVolume.shapeToString() << std::fixed << std::setprecision(4)
        << ", min " << cpuVolume.min() << ", max " << cpuVolume.max() << ", mean " << cpuVolume.mean()
        << ", std " << cpuVolume.stddev() << "\n";
    std::cout << out.str();
  }
}
