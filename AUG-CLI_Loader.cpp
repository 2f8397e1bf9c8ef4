#include "AUG-CLI_Loader.hpp"
#include "AUG-CLI_VolumeLoader.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <stdexcept>

namespace AUG_CLI {

//===================================================================================================================//

// Empty stays empty so validation can report it.
static std::string resolveConfigPath(const std::string& path, const std::string& baseDirPath) {
    if (path.empty()) return path;
    return QDir::cleanPath(QString::fromStdString(VolumeLoader::resolvePath(path, baseDirPath))).toStdString();
}

//===================================================================================================================//

nlohmann::json Loader::readJson(const std::string& filePath) {
    QFile file(QString::fromStdString(filePath));

    if (!file.open(QIODevice::ReadOnly)) {
        throw std::runtime_error("Failed to open config file: " + filePath);
    }

    QByteArray fileData = file.readAll();

    try {
        return nlohmann::json::parse(fileData.toStdString());
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + filePath + ": " + e.what());
    }
}

//===================================================================================================================//

AugmentConfig Loader::loadConfig(const std::string& configFilePath, const ConfigOverrides& overrides) {
    nlohmann::json json = readJson(configFilePath);
    std::string baseDirPath = QFileInfo(QString::fromStdString(configFilePath)).absolutePath().toStdString();

    return parseConfig(json, baseDirPath, overrides);
}

//===================================================================================================================//

AugmentConfig Loader::parseConfig(const nlohmann::json& json, const std::string& baseDirPath,
                                  const ConfigOverrides& overrides) {
    if (!json.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    AugmentConfig config;

    config.imgPrefix = json.value("imgPrefix", std::string());
    config.maskPrefix = json.value("maskPrefix", std::string());
    config.device = json.value("device", std::string("CPU"));
    config.progressReports = json.value("progressReports", static_cast<ulong>(1000));

    if (json.contains("imagesInputPath")) {
        config.imagesInputPath = resolveConfigPath(json.at("imagesInputPath").get<std::string>(), baseDirPath);
    }

    if (json.contains("outputPath")) {
        config.outputPath = resolveConfigPath(json.at("outputPath").get<std::string>(), baseDirPath);
    }

    if (json.contains("previewPath")) {
        config.previewPath = resolveConfigPath(json.at("previewPath").get<std::string>(), baseDirPath);
    }

    if (json.contains("filesStructure")) {
        config.filesStructure = filesStructureFromString(json.at("filesStructure").get<std::string>());
    }

    if (json.contains("mode")) {
        config.mode = batchModeFromString(json.at("mode").get<std::string>());
    }

    if (json.contains("seed") && !json.at("seed").is_null()) {
        config.seed = json.at("seed").get<unsigned>();
    }

    if (json.contains("transforms")) {
        config.transforms = json.at("transforms");
    }

    // CLI overrides (relative to the working directory)
    if (overrides.mode.has_value()) {
        config.mode = batchModeFromString(overrides.mode.value());
    }
    if (overrides.imagesInputPath.has_value()) {
        config.imagesInputPath = QFileInfo(QString::fromStdString(overrides.imagesInputPath.value()))
                                   .absoluteFilePath().toStdString();
    }
    if (overrides.outputPath.has_value()) {
        config.outputPath = QFileInfo(QString::fromStdString(overrides.outputPath.value()))
                              .absoluteFilePath().toStdString();
    }
    if (overrides.device.has_value()) {
        config.device = overrides.device.value();
    }
    if (overrides.seed.has_value()) {
        config.seed = overrides.seed.value();
    }

    // Default preview folder: <output or input>/preview
    if (config.previewPath.empty()) {
        const std::string& base = config.outputPath.empty() ? config.imagesInputPath : config.outputPath;
        if (!base.empty()) {
            config.previewPath = QDir(QString::fromStdString(base)).filePath("preview").toStdString();
        }
    }

    return config;
}

//===================================================================================================================//

} // namespace AUG_CLI
