#include "AUG-CLI_Transforms.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace AUG_CLI {

//===================================================================================================================//
//-- Helpers --//
//===================================================================================================================//

// Volumes are processed as a stack of y/x planes: data[(plane * h + y) * w + x]
struct PlaneLayout {
  ulong planes;
  ulong h;
  ulong w;
};

static PlaneLayout planeLayout(const Volume& volume) {
  const auto& shape = volume.shape();
  ulong w = shape.back();
  ulong h = (shape.size() >= 2) ? shape[shape.size() - 2] : 1;
  ulong planes = (h * w > 0) ? volume.size() / (h * w) : 0;
  return {planes, h, w};
}

static ulong resolveAxis(int axis, ulong ndim) {
  long resolved = (axis < 0) ? static_cast<long>(ndim) + axis : axis;

  if (resolved < 0 || resolved >= static_cast<long>(ndim)) {
    throw std::out_of_range("Axis " + std::to_string(axis) + " is out of range for a " + std::to_string(ndim) +
                            "D volume");
  }

  return static_cast<ulong>(resolved);
}

//===================================================================================================================//

static Volume flipAxis(const Volume& volume, int axis) {
  ulong ax = resolveAxis(axis, volume.ndim());
  if (volume.empty()) return volume;

  const auto& shape = volume.shape();
  ulong inner = 1;
  for (ulong i = ax + 1; i < shape.size(); i++) inner *= shape[i];
  ulong extent = shape[ax];
  ulong outer = volume.size() / (inner * extent);

  const auto& data = volume.data();
  std::vector<float> result(data.size());

  for (ulong o = 0; o < outer; o++) {
    for (ulong e = 0; e < extent; e++) {
      auto src = data.begin() + static_cast<long>((o * extent + e) * inner);
      auto dst = result.begin() + static_cast<long>((o * extent + (extent - 1 - e)) * inner);
      std::copy(src, src + static_cast<long>(inner), dst);
    }
  }

  return volume.withData(std::move(result));
}

//===================================================================================================================//

// One counter-clockwise quarter turn of every y/x plane; output planes are w x h.
static Volume rotateQuarter(const Volume& volume) {
  PlaneLayout layout = planeLayout(volume);
  const auto& data = volume.data();
  std::vector<float> result(data.size());

  for (ulong p = 0; p < layout.planes; p++) {
    ulong offset = p * layout.h * layout.w;
    for (ulong r = 0; r < layout.w; r++) {
      for (ulong c = 0; c < layout.h; c++) {
        result[offset + r * layout.h + c] = data[offset + c * layout.w + (layout.w - 1 - r)];
      }
    }
  }

  std::vector<ulong> shape = volume.shape();
  if (shape.size() >= 2) {
    std::swap(shape[shape.size() - 1], shape[shape.size() - 2]);
  } else {
    // A 1D volume is a single row; a quarter turn makes it a column
    shape = {layout.w, 1};
  }

  // Voxel sizes follow their axes; orientation and origin stay so the turn shows in physical space
  VolumeMetadata metadata = volume.metadata();
  if (volume.ndim() >= 2 && metadata.spacing.size() >= 2) std::swap(metadata.spacing[0], metadata.spacing[1]);

  return volume.withShape(std::move(shape), std::move(result)).withMetadata(std::move(metadata));
}

//===================================================================================================================//

static Volume rotatePlanes(const Volume& volume, float angle, bool nearest) {
  PlaneLayout layout = planeLayout(volume);
  int h = static_cast<int>(layout.h);
  int w = static_cast<int>(layout.w);
  float cosA = std::cos(angle);
  float sinA = std::sin(angle);
  float cx = static_cast<float>(w - 1) / 2.0f;
  float cy = static_cast<float>(h - 1) / 2.0f;

  const auto& data = volume.data();
  std::vector<float> result(data.size(), 0.0f);

  for (ulong p = 0; p < layout.planes; p++) {
    ulong offset = p * layout.h * layout.w;

    auto sample = [&](int sx, int sy) -> float {
      if (sx < 0 || sx >= w || sy < 0 || sy >= h) return 0.0f;
      return data[offset + static_cast<ulong>(sy) * layout.w + static_cast<ulong>(sx)];
    };

    for (int y = 0; y < h; y++) {
      for (int x = 0; x < w; x++) {
        // Map destination (x,y) back to source
        float srcX = cosA * (x - cx) + sinA * (y - cy) + cx;
        float srcY = -sinA * (x - cx) + cosA * (y - cy) + cy;
        float value;

        if (nearest) {
          value = sample(static_cast<int>(std::lround(srcX)), static_cast<int>(std::lround(srcY)));
        } else {
          // Bilinear interpolation
          int x0 = static_cast<int>(std::floor(srcX));
          int y0 = static_cast<int>(std::floor(srcY));
          float fx = srcX - x0;
          float fy = srcY - y0;

          value = (1 - fx) * (1 - fy) * sample(x0, y0) +
                  fx * (1 - fy) * sample(x0 + 1, y0) +
                  (1 - fx) * fy * sample(x0, y0 + 1) +
                  fx * fy * sample(x0 + 1, y0 + 1);
        }

        result[offset + static_cast<ulong>(y) * layout.w + static_cast<ulong>(x)] = value;
      }
    }
  }

  return volume.withData(std::move(result));
}

//===================================================================================================================//

static Volume translatePlanes(const Volume& volume, long dx, long dy) {
  PlaneLayout layout = planeLayout(volume);
  long h = static_cast<long>(layout.h);
  long w = static_cast<long>(layout.w);

  const auto& data = volume.data();
  std::vector<float> result(data.size(), 0.0f);

  for (ulong p = 0; p < layout.planes; p++) {
    ulong offset = p * layout.h * layout.w;
    for (long y = 0; y < h; y++) {
      long srcY = y - dy;
      if (srcY < 0 || srcY >= h) continue;
      for (long x = 0; x < w; x++) {
        long srcX = x - dx;
        if (srcX < 0 || srcX >= w) continue;
        result[offset + static_cast<ulong>(y * w + x)] = data[offset + static_cast<ulong>(srcY * w + srcX)];
      }
    }
  }

  return volume.withData(std::move(result));
}

//===================================================================================================================//
//-- Deterministic transforms --//
//===================================================================================================================//

Volume FlipTransform::operator()(const Volume& volume) const {
  return flipAxis(volume, this->axis);
}

std::optional<nlohmann::json> FlipTransform::transformInfo() const {
  return nlohmann::json{{"class", "Flip"}, {"axis", this->axis}};
}

//===================================================================================================================//

Volume Rotate90Transform::operator()(const Volume& volume) const {
  Volume result = volume;
  for (int i = 0; i < this->k; i++) result = rotateQuarter(result);
  return result;
}

std::optional<nlohmann::json> Rotate90Transform::transformInfo() const {
  return nlohmann::json{{"class", "Rotate90"}, {"k", this->k}};
}

//===================================================================================================================//

Volume ScaleIntensityTransform::operator()(const Volume& volume) const {
  float lo = volume.min();
  float hi = volume.max();
  std::vector<float> result(volume.size());

  if (hi - lo <= 0.0f) {
    std::fill(result.begin(), result.end(), this->minValue);
    return volume.withData(std::move(result));
  }

  float scale = (this->maxValue - this->minValue) / (hi - lo);
  std::transform(volume.data().begin(), volume.data().end(), result.begin(),
                 [&](float v) { return (v - lo) * scale + this->minValue; });

  return volume.withData(std::move(result));
}

std::optional<nlohmann::json> ScaleIntensityTransform::transformInfo() const {
  return nlohmann::json{{"class", "ScaleIntensity"}, {"min", this->minValue}, {"max", this->maxValue}};
}

//===================================================================================================================//

Volume NormalizeIntensityTransform::operator()(const Volume& volume) const {
  float mean = volume.mean();
  float stddev = volume.stddev();
  std::vector<float> result(volume.size());

  // A constant volume normalises to zeros
  float scale = (stddev > 0.0f) ? 1.0f / stddev : 0.0f;
  std::transform(volume.data().begin(), volume.data().end(), result.begin(),
                 [&](float v) { return (v - mean) * scale; });

  return volume.withData(std::move(result));
}

std::optional<nlohmann::json> NormalizeIntensityTransform::transformInfo() const {
  return nlohmann::json{{"class", "NormalizeIntensity"}};
}

//===================================================================================================================//

Volume ShiftIntensityTransform::operator()(const Volume& volume) const {
  std::vector<float> result(volume.size());
  std::transform(volume.data().begin(), volume.data().end(), result.begin(),
                 [&](float v) { return v + this->offset; });
  return volume.withData(std::move(result));
}

std::optional<nlohmann::json> ShiftIntensityTransform::transformInfo() const {
  return nlohmann::json{{"class", "ShiftIntensity"}, {"offset", this->offset}};
}

//===================================================================================================================//
//-- Randomizable transforms --//
//===================================================================================================================//

void RandFlipTransform::randomize(const Volume& /*reference*/) {}

Volume RandFlipTransform::applyRandomized(const std::string& /*key*/, const Volume& volume) const {
  return flipAxis(volume, this->axis);
}

std::optional<nlohmann::json> RandFlipTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandFlip"}, {"prob", this->prob}, {"axis", this->axis}};
}

//===================================================================================================================//

void RandRotateTransform::randomize(const Volume& /*reference*/) {
  std::uniform_real_distribution<float> dist(-this->rangeDegrees, this->rangeDegrees);
  this->angle = dist(this->rng) * static_cast<float>(M_PI) / 180.0f;
}

Volume RandRotateTransform::applyRandomized(const std::string& key, const Volume& volume) const {
  return rotatePlanes(volume, this->angle, key == MASK_KEY);
}

std::optional<nlohmann::json> RandRotateTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandRotate"}, {"prob", this->prob}, {"range", this->rangeDegrees}};
}

//===================================================================================================================//

void RandTranslateTransform::randomize(const Volume& reference) {
  PlaneLayout layout = planeLayout(reference);
  long maxDx = static_cast<long>(this->maxFraction * static_cast<float>(layout.w));
  long maxDy = static_cast<long>(this->maxFraction * static_cast<float>(layout.h));

  std::uniform_int_distribution<long> distX(-maxDx, maxDx);
  std::uniform_int_distribution<long> distY(-maxDy, maxDy);
  this->dx = distX(this->rng);
  this->dy = distY(this->rng);
}

Volume RandTranslateTransform::applyRandomized(const std::string& /*key*/, const Volume& volume) const {
  if (this->dx == 0 && this->dy == 0) return volume;
  return translatePlanes(volume, this->dx, this->dy);
}

std::optional<nlohmann::json> RandTranslateTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandTranslate"}, {"prob", this->prob}, {"fraction", this->maxFraction}};
}

//===================================================================================================================//

void RandGaussianNoiseTransform::randomize(const Volume& reference) {
  std::normal_distribution<float> dist(this->mean, this->stddev);
  this->noise.resize(reference.size());
  for (auto& n : this->noise) n = dist(this->rng);
}

Volume RandGaussianNoiseTransform::applyRandomized(const std::string& key, const Volume& volume) const {
  if (volume.size() != this->noise.size()) {
    throw std::runtime_error("RandGaussianNoise: volume '" + key + "' has " + std::to_string(volume.size()) +
                             " samples, noise was drawn for " + std::to_string(this->noise.size()));
  }

  std::vector<float> result(volume.size());
  for (ulong i = 0; i < result.size(); i++) result[i] = volume.data()[i] + this->noise[i];
  return volume.withData(std::move(result));
}

std::optional<nlohmann::json> RandGaussianNoiseTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandGaussianNoise"}, {"prob", this->prob}, {"mean", this->mean},
                        {"std", this->stddev}};
}

//===================================================================================================================//

void RandShiftIntensityTransform::randomize(const Volume& /*reference*/) {
  std::uniform_real_distribution<float> dist(-this->offsets, this->offsets);
  this->offset = dist(this->rng);
}

Volume RandShiftIntensityTransform::applyRandomized(const std::string& /*key*/, const Volume& volume) const {
  return ShiftIntensityTransform(this->offset)(volume);
}

std::optional<nlohmann::json> RandShiftIntensityTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandShiftIntensity"}, {"prob", this->prob}, {"offsets", this->offsets}};
}

//===================================================================================================================//

void RandAdjustContrastTransform::randomize(const Volume& /*reference*/) {
  std::uniform_real_distribution<float> dist(this->gammaMin, this->gammaMax);
  this->gamma = dist(this->rng);
}

Volume RandAdjustContrastTransform::applyRandomized(const std::string& /*key*/, const Volume& volume) const {
  const float epsilon = 1e-7f;
  float lo = volume.min();
  float range = volume.max() - lo;
  std::vector<float> result(volume.size());

  std::transform(volume.data().begin(), volume.data().end(), result.begin(), [&](float v) {
    return std::pow((v - lo) / (range + epsilon), this->gamma) * range + lo;
  });

  return volume.withData(std::move(result));
}

std::optional<nlohmann::json> RandAdjustContrastTransform::transformInfo() const {
  return nlohmann::json{{"class", "RandAdjustContrast"}, {"prob", this->prob},
                        {"gamma", {this->gammaMin, this->gammaMax}}};
}

//===================================================================================================================//

} // namespace AUG_CLI
