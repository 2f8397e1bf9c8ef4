#include "AUG-CLI_Volume.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace AUG_CLI {

//===================================================================================================================//

ulong sampleCount(const std::vector<ulong>& shape) {
  ulong count = 1;

  for (ulong extent : shape) {
    if (__builtin_mul_overflow(count, extent, &count)) {
      std::string dims;
      for (ulong e : shape) dims += (dims.empty() ? "" : "x") + std::to_string(e);
      throw std::runtime_error("Volume shape " + dims + " has too many samples");
    }
  }

  return count;
}

//===================================================================================================================//

Volume::Volume(std::vector<ulong> shape, std::vector<float> data, Device device, VolumeMetadata metadata)
    : dims(std::move(shape)), samples(std::move(data)), placement(device), meta(std::move(metadata)) {
  if (this->dims.empty() || sampleCount(this->dims) != this->samples.size()) {
    throw std::runtime_error("Volume data size (" + std::to_string(this->samples.size()) +
                             ") does not match shape " + this->shapeToString());
  }
}

//===================================================================================================================//

Volume Volume::to(const Device& device) const {
  Volume result = *this;
  result.placement = device;
  return result;
}

//===================================================================================================================//

Volume Volume::withData(std::vector<float> data) const {
  return Volume(this->dims, std::move(data), this->placement, this->meta);
}

//===================================================================================================================//

Volume Volume::withShape(std::vector<ulong> shape, std::vector<float> data) const {
  return Volume(std::move(shape), std::move(data), this->placement, this->meta);
}

//===================================================================================================================//

Volume Volume::withMetadata(VolumeMetadata metadata) const {
  Volume result = *this;
  result.meta = std::move(metadata);
  return result;
}

//===================================================================================================================//

bool Volume::any() const {
  return std::any_of(this->samples.begin(), this->samples.end(), [](float v) { return v != 0.0f; });
}

//===================================================================================================================//

float Volume::min() const {
  if (this->samples.empty()) return 0.0f;
  return *std::min_element(this->samples.begin(), this->samples.end());
}

float Volume::max() const {
  if (this->samples.empty()) return 0.0f;
  return *std::max_element(this->samples.begin(), this->samples.end());
}

float Volume::mean() const {
  if (this->samples.empty()) return 0.0f;
  double sum = std::accumulate(this->samples.begin(), this->samples.end(), 0.0);
  return static_cast<float>(sum / static_cast<double>(this->samples.size()));
}

float Volume::stddev() const {
  if (this->samples.empty()) return 0.0f;
  double mean = this->mean();
  double acc = 0.0;
  for (float v : this->samples) acc += (v - mean) * (v - mean);
  return static_cast<float>(std::sqrt(acc / static_cast<double>(this->samples.size())));
}

//===================================================================================================================//

bool Volume::operator==(const Volume& other) const {
  return this->dims == other.dims && this->samples == other.samples && this->placement == other.placement;
}

//===================================================================================================================//

std::string Volume::shapeToString() const {
  std::string result;

  for (size_t i = 0; i < this->dims.size(); ++i) {
    if (i > 0) result += "x";
    result += std::to_string(this->dims[i]);
  }

  return result.empty() ? "()" : result;
}

//===================================================================================================================//

} // namespace AUG_CLI
