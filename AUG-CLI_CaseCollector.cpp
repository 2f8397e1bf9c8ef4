#include "AUG-CLI_CaseCollector.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>
#include <stdexcept>

namespace AUG_CLI {

//===================================================================================================================//

FilesStructure filesStructureFromString(const std::string& name) {
  std::string lower = QString::fromStdString(name).trimmed().toLower().toStdString();
  auto it = filesStructureMap.find(lower);

  if (it == filesStructureMap.end()) {
    throw std::runtime_error("Unknown files structure: " + name + " (expected 'case-folders' or 'flat')");
  }

  return it->second;
}

std::string filesStructureToString(FilesStructure structure) {
  for (const auto& [key, value] : filesStructureMap) {
    if (value == structure) return key;
  }

  return "unknown";
}

//===================================================================================================================//

PrefixParts CaseCollector::splitPrefix(const std::string& prefix) {
  PrefixParts parts;
  size_t dot = prefix.find('.');

  if (dot == std::string::npos) {
    parts.stem = prefix;
    parts.extension = "nrrd";
  } else {
    parts.stem = prefix.substr(0, dot);
    parts.extension = prefix.substr(dot + 1);
    if (parts.extension.empty()) parts.extension = "nrrd";
  }

  return parts;
}

//===================================================================================================================//

std::vector<std::string> CaseCollector::collectFiles(const std::string& inputDir, const std::string& prefix) {
  std::vector<std::string> files;

  if (prefix.empty()) return files;

  QString fileName = QString::fromStdString(splitPrefix(prefix).fileName());
  QString flatSuffix = "_" + fileName;

  QDirIterator it(QString::fromStdString(inputDir), QDir::Files, QDirIterator::Subdirectories);

  while (it.hasNext()) {
    QString path = it.next();
    QString name = it.fileName();

    if (name.compare(fileName, Qt::CaseInsensitive) == 0 || name.endsWith(flatSuffix, Qt::CaseInsensitive)) {
      files.push_back(QDir::cleanPath(path).toStdString());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

//===================================================================================================================//

std::pair<std::vector<std::string>, std::vector<std::string>> CaseCollector::collectImagesAndMasks(
  const std::string& inputDir, const std::string& imgPrefix, const std::string& maskPrefix) {
  if (!QFileInfo(QString::fromStdString(inputDir)).isDir()) {
    throw std::runtime_error("Input directory does not exist: " + inputDir);
  }

  std::vector<std::string> imgs = collectFiles(inputDir, imgPrefix);
  std::vector<std::string> masks = collectFiles(inputDir, maskPrefix);

  return {imgs, masks};
}

//===================================================================================================================//

CaseIdentity CaseCollector::resolveCase(const std::string& imgPath, const std::optional<std::string>& maskPath,
                                        FilesStructure structure, const std::string& imgPrefix) {
  QFileInfo imgInfo(QString::fromStdString(imgPath));
  CaseIdentity identity;
  identity.imagePath = imgPath;
  identity.maskPath = maskPath;

  switch (structure) {
    case FilesStructure::FLAT: {
      QString name = imgInfo.fileName();
      QString suffix = "_" + QString::fromStdString(splitPrefix(imgPrefix).fileName());

      if (name.endsWith(suffix, Qt::CaseInsensitive)) {
        name.chop(suffix.size());
      } else {
        name = imgInfo.completeBaseName();
      }

      identity.caseName = name.toStdString();
      break;
    }
    case FilesStructure::CASE_FOLDERS:
      identity.caseName = imgInfo.absoluteDir().dirName().toStdString();
      break;
    default:
      throw std::runtime_error("Cannot resolve case name for files structure: " + filesStructureToString(structure));
  }

  if (identity.caseName.empty()) {
    throw std::runtime_error("Cannot resolve case name for: " + imgPath);
  }

  return identity;
}

//===================================================================================================================//

} // namespace AUG_CLI
