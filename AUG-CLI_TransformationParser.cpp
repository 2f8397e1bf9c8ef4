#include "AUG-CLI_TransformationParser.hpp"
#include "AUG-CLI_Transforms.hpp"

#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

Transformations TransformationParser::parse(const nlohmann::json& transformsJson, std::optional<unsigned int> seed) {
  if (!transformsJson.is_array()) {
    throw std::runtime_error("'transforms' must be an array");
  }

  Transformations transformations;
  transformations.reserve(transformsJson.size());
  unsigned int randomIndex = 0;

  for (const auto& transformJson : transformsJson) {
    TransformEntry entry = parseTransform(transformJson);

    if (entry.kind() == TransformKind::RANDOMIZABLE && seed.has_value()) {
      entry.randomizable().setRandomState(seed.value() + randomIndex);
    }

    if (entry.kind() == TransformKind::RANDOMIZABLE) randomIndex++;

    transformations.push_back(std::move(entry));
  }

  return transformations;
}

//===================================================================================================================//

std::vector<std::string> TransformationParser::supportedTypes() {
  return {"Flip",    "Rotate90",      "ScaleIntensity",    "NormalizeIntensity", "ShiftIntensity",
          "RandFlip", "RandRotate",   "RandTranslate",     "RandGaussianNoise",  "RandShiftIntensity",
          "RandAdjustContrast"};
}

//===================================================================================================================//

TransformEntry TransformationParser::parseTransform(const nlohmann::json& transformJson) {
  if (!transformJson.is_object() || !transformJson.contains("type")) {
    throw std::runtime_error("Each transform must be an object with a 'type' field");
  }

  std::string type = transformJson.at("type").get<std::string>();
  float prob = transformJson.value("prob", 0.5f);

  //-- Deterministic --//
  if (type == "Flip") {
    return makeTransform<FlipTransform>(transformJson.value("axis", -1));
  }

  if (type == "Rotate90") {
    return makeTransform<Rotate90Transform>(transformJson.value("k", 1));
  }

  if (type == "ScaleIntensity") {
    return makeTransform<ScaleIntensityTransform>(transformJson.value("min", 0.0f), transformJson.value("max", 1.0f));
  }

  if (type == "NormalizeIntensity") {
    return makeTransform<NormalizeIntensityTransform>();
  }

  if (type == "ShiftIntensity") {
    if (!transformJson.contains("offset")) {
      throw std::runtime_error("Transform 'ShiftIntensity' requires 'offset'");
    }
    return makeTransform<ShiftIntensityTransform>(transformJson.at("offset").get<float>());
  }

  //-- Randomizable --//
  if (type == "RandFlip") {
    return makeTransform<RandFlipTransform>(prob, transformJson.value("axis", -1));
  }

  if (type == "RandRotate") {
    float range = transformJson.value("range", 15.0f);
    if (!(range >= 0.0f)) {
      throw std::runtime_error("Transform 'RandRotate' requires range >= 0");
    }
    return makeTransform<RandRotateTransform>(prob, range);
  }

  if (type == "RandTranslate") {
    float fraction = transformJson.value("fraction", 0.1f);
    if (!(fraction >= 0.0f && fraction <= 1.0f)) {
      throw std::runtime_error("Transform 'RandTranslate' requires fraction in [0, 1]");
    }
    return makeTransform<RandTranslateTransform>(prob, fraction);
  }

  if (type == "RandGaussianNoise") {
    float stddev = transformJson.value("std", 0.1f);
    if (!(stddev > 0.0f)) {
      throw std::runtime_error("Transform 'RandGaussianNoise' requires std > 0");
    }
    return makeTransform<RandGaussianNoiseTransform>(prob, transformJson.value("mean", 0.0f), stddev);
  }

  if (type == "RandShiftIntensity") {
    float offsets = transformJson.value("offsets", 0.1f);
    if (!(offsets >= 0.0f)) {
      throw std::runtime_error("Transform 'RandShiftIntensity' requires offsets >= 0");
    }
    return makeTransform<RandShiftIntensityTransform>(prob, offsets);
  }

  if (type == "RandAdjustContrast") {
    float gammaMin = 0.5f;
    float gammaMax = 4.5f;

    if (transformJson.contains("gamma")) {
      const auto& gamma = transformJson.at("gamma");
      if (!gamma.is_array() || gamma.size() != 2) {
        throw std::runtime_error("Transform 'RandAdjustContrast' expects 'gamma' as [min, max]");
      }
      gammaMin = gamma.at(0).get<float>();
      gammaMax = gamma.at(1).get<float>();
    }

    if (gammaMin > gammaMax) {
      throw std::runtime_error("Transform 'RandAdjustContrast' requires gamma min <= max");
    }

    return makeTransform<RandAdjustContrastTransform>(prob, gammaMin, gammaMax);
  }

  throw std::runtime_error("Unknown transform type: " + type);
}
