#include "AUG-CLI_BatchDriver.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace AUG_CLI;

//===================================================================================================================//

BatchDriver::BatchDriver(BatchMode mode, CaseSink& sink, LogLevel logLevel)
    : mode(mode), sink(sink), logLevel(logLevel) {
  this->errorPolicy = (mode == BatchMode::PROCESS) ? CaseErrorPolicy::PROPAGATE : CaseErrorPolicy::LOG_AND_CONTINUE;
}

//===================================================================================================================//

BatchSummary BatchDriver::run(const BatchInput& input) {
  auto startTime = std::chrono::steady_clock::now();

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << "Processing started (" << batchModeToString(this->mode) << ", " << input.imgPaths.size()
              << " case(s), device " << input.device.toString() << ")\n";
  }

  // Preview only looks at the first case
  std::vector<std::string> imgPaths = input.imgPaths;
  std::vector<std::string> maskPaths = input.maskPaths;

  if (this->mode == BatchMode::PREVIEW) {
    if (imgPaths.size() > 1) imgPaths.resize(1);
    if (maskPaths.size() > 1) maskPaths.resize(1);
  }

  AugmentationDataset dataset(imgPaths, maskPaths, input.transformations, input.device, this->volumeSource);

  this->sink.beginBatch();

  BatchSummary summary;
  ulong total = dataset.size();

  for (ulong idx = 0; idx < total; ++idx) {
    summary.attempted++;

    try {
      this->runCase(dataset, input, idx);
      summary.succeeded++;
    } catch (const std::exception& e) {
      summary.failed++;

      if (this->errorPolicy == CaseErrorPolicy::PROPAGATE) {
        throw;
      }

      if (this->logLevel >= LogLevel::ERROR) {
        std::cerr << "Error: case " << (idx + 1) << " (" << imgPaths[idx] << "): " << e.what() << std::endl;
      }
    }

    if (this->progressCallback) {
      this->progressCallback(idx + 1, total);
    }
  }

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - startTime;
  summary.elapsedSeconds = elapsed.count();
  summary.message = completionMessage(summary.elapsedSeconds);

  if (this->completionCallback) {
    this->completionCallback(summary.message);
  }

  if (this->logLevel >= LogLevel::INFO) {
    std::cout << summary.message << "\n";
  }

  return summary;
}

//===================================================================================================================//

void BatchDriver::runCase(const AugmentationDataset& dataset, const BatchInput& input, ulong idx) {
  CaseOutput output = dataset.getCase(idx);

  std::optional<std::string> maskPath;
  if (idx < input.maskPaths.size()) maskPath = input.maskPaths[idx];

  CaseIdentity identity = CaseCollector::resolveCase(input.imgPaths[idx], maskPath, input.filesStructure,
                                                     input.imgPrefix);

  if (this->logLevel >= LogLevel::DEBUG) {
    std::cout << "Case " << (idx + 1) << ": " << identity.caseName << " (" << output.transformedImages.size()
              << " image result(s), " << output.transformedMasks.size() << " mask result(s))\n";
  }

  for (ulong i = 0; i < output.transformedImages.size(); ++i) {
    const auto& [transformName, image] = output.transformedImages[i];

    CaseUnit unit{identity, transformName, image, std::nullopt,
                  imageNodeName(identity.caseName, transformName), maskNodeName(identity.caseName, transformName)};

    if (i < output.transformedMasks.size()) {
      const Volume& mask = output.transformedMasks[i].second;

      // Empty masks carry nothing worth persisting
      if (this->mode == BatchMode::PREVIEW || mask.any()) {
        unit.mask = mask;
      }
    }

    this->sink.consume(unit);
  }
}

//===================================================================================================================//

std::string BatchDriver::imageNodeName(const std::string& caseName, const std::string& transformName) {
  return caseName + "_" + transformName + "_img";
}

std::string BatchDriver::maskNodeName(const std::string& caseName, const std::string& transformName) {
  return caseName + "_" + transformName + "_mask";
}

//===================================================================================================================//

std::string BatchDriver::completionMessage(double elapsedSeconds) {
  std::ostringstream oss;
  oss << "Processing completed in " << std::fixed << std::setprecision(2) << elapsedSeconds << " seconds";
  return oss.str();
}
