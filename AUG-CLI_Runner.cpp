#include "AUG-CLI_Runner.hpp"

#include "AUG-CLI_CaseCollector.hpp"
#include "AUG-CLI_Loader.hpp"
#include "AUG-CLI_ProgressBar.hpp"
#include "AUG-CLI_SlicePreviewer.hpp"
#include "AUG-CLI_TransformClassifier.hpp"
#include "AUG-CLI_TransformationParser.hpp"
#include "AUG-CLI_Validator.hpp"
#include "AUG-CLI_VolumeStorage.hpp"

#include <iostream>
#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

Runner::Runner(const QCommandLineParser& parser, LogLevel logLevel)
    : parser(parser), logLevel(logLevel) {
  QString configPath = this->parser.value("config");
  ConfigOverrides overrides = overridesFromParser(this->parser);

  this->config = Loader::loadConfig(configPath.toStdString(), overrides);
  Validator::validateConfig(this->config);
  this->device = Device::fromSelector(this->config.device);

  // Display info
  std::string modeDisplay = batchModeToString(this->config.mode) + (overrides.mode.has_value() ? " (CLI)" : "");
  std::string deviceDisplay = this->device.toString() + (overrides.device.has_value() ? " (CLI)" : "");

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Loading configuration from: " << configPath.toStdString() << "\n";
    std::cout << "Mode: " << modeDisplay << ", Device: " << deviceDisplay << "\n";
    std::cout << "Input: " << this->config.imagesInputPath
              << " (" << filesStructureToString(this->config.filesStructure) << ")\n";
  }
}

//===================================================================================================================//

ConfigOverrides Runner::overridesFromParser(const QCommandLineParser& parser) {
  ConfigOverrides overrides;

  if (parser.isSet("mode")) {
    overrides.mode = parser.value("mode").toLower().toStdString();
  }

  if (parser.isSet("input")) {
    overrides.imagesInputPath = parser.value("input").toStdString();
  }

  if (parser.isSet("output")) {
    overrides.outputPath = parser.value("output").toStdString();
  }

  if (parser.isSet("device")) {
    overrides.device = parser.value("device").toStdString();
  }

  if (parser.isSet("seed")) {
    bool ok = false;
    uint seed = parser.value("seed").toUInt(&ok);

    if (!ok) {
      throw std::runtime_error("Seed must be a non-negative integer (got '" + parser.value("seed").toStdString() + "').");
    }

    overrides.seed = seed;
  }

  return overrides;
}

//===================================================================================================================//

int Runner::run() {
  BatchInput input = this->buildBatchInput();

  if (this->config.mode == BatchMode::PREVIEW) return this->runPreview(input);
  return this->runProcess(input);
}

//===================================================================================================================//

BatchInput Runner::buildBatchInput() {
  auto [imgs, masks] = CaseCollector::collectImagesAndMasks(this->config.imagesInputPath, this->config.imgPrefix,
                                                            this->config.maskPrefix);
  Validator::validateCollectedImagesAndMasks(imgs, masks);

  BatchInput input;
  input.imgPaths = imgs;
  input.maskPaths = masks;
  input.transformations = TransformationParser::parse(this->config.transforms, this->config.seed);
  input.device = this->device;
  input.filesStructure = this->config.filesStructure;
  input.imgPrefix = this->config.imgPrefix;

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Found " << imgs.size() << " image(s) and " << masks.size() << " mask(s)\n";
    std::cout << "Transformations:";
    for (const auto& entry : input.transformations) {
      std::cout << " " << TransformClassifier::nameOf(entry)
                << " (" << TransformClassifier::kindToName(TransformClassifier::classify(entry)) << ")";
    }
    std::cout << "\n";
  }

  return input;
}

//===================================================================================================================//

BatchSummary Runner::runBatch(CaseSink& sink, const BatchInput& input) {
  BatchDriver driver(this->config.mode, sink, this->logLevel);

  ProgressBar progressBar("Augmenting cases:", this->config.progressReports);

  if (this->logLevel > LogLevel::QUIET) {
    driver.setProgressCallback([&progressBar](ulong current, ulong total) {
      progressBar.update(current, total);
    });
  }

  return driver.run(input);
}

//===================================================================================================================//

int Runner::runProcess(const BatchInput& input) {
  VolumeStorage storage(this->config.outputPath, this->config.imgPrefix, this->config.maskPrefix, this->logLevel);

  BatchSummary summary = this->runBatch(storage, input);

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Saved " << storage.getFilesWritten() << " file(s) for " << summary.succeeded
              << " case(s) to: " << VolumeStorage::outputRoot(this->config.outputPath) << "\n";
  }

  return 0;
}

//===================================================================================================================//

int Runner::runPreview(const BatchInput& input) {
  SlicePreviewer previewer(this->config.previewPath, this->logLevel);

  BatchSummary summary = this->runBatch(previewer, input);

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Preview written to: " << this->config.previewPath << " (" << previewer.getNodeNames().size()
              << " node(s)";
    if (summary.failed > 0) std::cout << ", " << summary.failed << " failed case(s)";
    std::cout << ")\n";
  }

  return 0;
}
