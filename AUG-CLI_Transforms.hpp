#ifndef AUG_CLI_TRANSFORMS_HPP
#define AUG_CLI_TRANSFORMS_HPP

#include "AUG-CLI_Transform.hpp"

#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// Built-in transforms. Spatial transforms act on the two fastest axes (the in-plane y/x axes of
// every slice); axis arguments index the volume shape, negative values count from the end.

//-- Deterministic --//

class FlipTransform : public DeterministicTransform {
  public:
    explicit FlipTransform(int axis = -1) : axis(axis) {}

    Volume operator()(const Volume& volume) const override;
    std::optional<nlohmann::json> transformInfo() const override;

  private:
    int axis;
};

class Rotate90Transform : public DeterministicTransform {
  public:
    // Counter-clockwise quarter turns in the y/x plane.
    explicit Rotate90Transform(int k = 1) : k(((k % 4) + 4) % 4) {}

    Volume operator()(const Volume& volume) const override;
    std::optional<nlohmann::json> transformInfo() const override;

  private:
    int k;
};

class ScaleIntensityTransform : public DeterministicTransform {
  public:
    ScaleIntensityTransform(float minValue = 0.0f, float maxValue = 1.0f) : minValue(minValue), maxValue(maxValue) {}

    Volume operator()(const Volume& volume) const override;
    std::optional<nlohmann::json> transformInfo() const override;

  private:
    float minValue;
    float maxValue;
};

class NormalizeIntensityTransform : public DeterministicTransform {
  public:
    Volume operator()(const Volume& volume) const override;
    std::optional<nlohmann::json> transformInfo() const override;
};

class ShiftIntensityTransform : public DeterministicTransform {
  public:
    explicit ShiftIntensityTransform(float offset) : offset(offset) {}

    Volume operator()(const Volume& volume) const override;
    std::optional<nlohmann::json> transformInfo() const override;

  private:
    float offset;
};

//-- Randomizable --//

class RandFlipTransform : public RandomizableTransform {
  public:
    RandFlipTransform(float prob = 0.5f, int axis = -1) : RandomizableTransform(prob), axis(axis) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    int axis;
};

class RandRotateTransform : public RandomizableTransform {
  public:
    // Uniform in-plane rotation in [-rangeDegrees, rangeDegrees] around the slice centre.
    // Bilinear interpolation for images, nearest neighbour for masks.
    RandRotateTransform(float prob = 0.5f, float rangeDegrees = 15.0f)
        : RandomizableTransform(prob), rangeDegrees(rangeDegrees) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    float rangeDegrees;
    float angle = 0.0f;  // radians, drawn by randomize()
};

class RandTranslateTransform : public RandomizableTransform {
  public:
    // Integer in-plane shift of up to maxFraction of the slice size, zero filled.
    RandTranslateTransform(float prob = 0.5f, float maxFraction = 0.1f)
        : RandomizableTransform(prob), maxFraction(maxFraction) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    float maxFraction;
    long dx = 0;
    long dy = 0;
};

class RandGaussianNoiseTransform : public RandomizableTransform {
  public:
    RandGaussianNoiseTransform(float prob = 0.5f, float mean = 0.0f, float stddev = 0.1f)
        : RandomizableTransform(prob, {IMAGE_KEY}), mean(mean), stddev(stddev) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    float mean;
    float stddev;
    std::vector<float> noise;
};

class RandShiftIntensityTransform : public RandomizableTransform {
  public:
    RandShiftIntensityTransform(float prob = 0.5f, float offsets = 0.1f)
        : RandomizableTransform(prob, {IMAGE_KEY}), offsets(offsets) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    float offsets;
    float offset = 0.0f;
};

class RandAdjustContrastTransform : public RandomizableTransform {
  public:
    // Gamma correction with gamma drawn from [gammaMin, gammaMax]; the intensity range is preserved.
    RandAdjustContrastTransform(float prob = 0.5f, float gammaMin = 0.5f, float gammaMax = 4.5f)
        : RandomizableTransform(prob, {IMAGE_KEY}), gammaMin(gammaMin), gammaMax(gammaMax) {}

    std::optional<nlohmann::json> transformInfo() const override;

  protected:
    void randomize(const Volume& reference) override;
    Volume applyRandomized(const std::string& key, const Volume& volume) const override;

  private:
    float gammaMin;
    float gammaMax;
    float gamma = 1.0f;
};

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_TRANSFORMS_HPP
