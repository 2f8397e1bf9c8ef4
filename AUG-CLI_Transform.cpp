#include "AUG-CLI_Transform.hpp"

#include <algorithm>
#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//
//-- RandomizableTransform --//
//===================================================================================================================//

RandomizableTransform::RandomizableTransform(float prob, std::vector<std::string> keys)
    : rng(std::random_device{}()), prob(std::clamp(prob, 0.0f, 1.0f)), keys(std::move(keys)) {}

//===================================================================================================================//

VolumeDict RandomizableTransform::operator()(const VolumeDict& data) {
  if (data.empty()) {
    return data;
  }

  std::uniform_real_distribution<float> coin(0.0f, 1.0f);
  this->doTransform = coin(this->rng) < this->prob;

  if (!this->doTransform) {
    return data;
  }

  auto reference = data.find(IMAGE_KEY);
  this->randomize(reference != data.end() ? reference->second : data.begin()->second);

  VolumeDict result;

  for (const auto& [key, volume] : data) {
    result.emplace(key, this->appliesTo(key) ? this->applyRandomized(key, volume) : volume);
  }

  return result;
}

//===================================================================================================================//

void RandomizableTransform::setRandomState(unsigned int seed) {
  this->rng.seed(seed);
}

//===================================================================================================================//

bool RandomizableTransform::appliesTo(const std::string& key) const {
  return std::find(this->keys.begin(), this->keys.end(), key) != this->keys.end();
}

//===================================================================================================================//
//-- TransformEntry --//
//===================================================================================================================//

TransformEntry::TransformEntry(std::shared_ptr<DeterministicTransform> transform) : value(std::move(transform)) {
  if (!std::get<std::shared_ptr<DeterministicTransform>>(this->value)) {
    throw std::invalid_argument("TransformEntry requires a non-null transform");
  }
}

TransformEntry::TransformEntry(std::shared_ptr<RandomizableTransform> transform) : value(std::move(transform)) {
  if (!std::get<std::shared_ptr<RandomizableTransform>>(this->value)) {
    throw std::invalid_argument("TransformEntry requires a non-null transform");
  }
}

//===================================================================================================================//

TransformKind TransformEntry::kind() const {
  return std::holds_alternative<std::shared_ptr<RandomizableTransform>>(this->value) ? TransformKind::RANDOMIZABLE
                                                                                      : TransformKind::DETERMINISTIC;
}

//===================================================================================================================//

DeterministicTransform& TransformEntry::deterministic() const {
  if (this->kind() != TransformKind::DETERMINISTIC) {
    throw std::logic_error("Transform entry is not deterministic");
  }

  return *std::get<std::shared_ptr<DeterministicTransform>>(this->value);
}

RandomizableTransform& TransformEntry::randomizable() const {
  if (this->kind() != TransformKind::RANDOMIZABLE) {
    throw std::logic_error("Transform entry is not randomizable");
  }

  return *std::get<std::shared_ptr<RandomizableTransform>>(this->value);
}

//===================================================================================================================//

const Transform& TransformEntry::transform() const {
  return std::visit([](const auto& ptr) -> const Transform& { return *ptr; }, this->value);
}
