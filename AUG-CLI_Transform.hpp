#ifndef AUG_CLI_TRANSFORM_HPP
#define AUG_CLI_TRANSFORM_HPP

#include "AUG-CLI_Volume.hpp"

#include <json.hpp>

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

//===================================================================================================================//

namespace AUG_CLI {

// Base of every transform. Transforms may describe themselves through transformInfo();
// the descriptor is a JSON object whose "class" field names the transform.
class Transform {
  public:
    virtual ~Transform() = default;

    virtual std::optional<nlohmann::json> transformInfo() const { return std::nullopt; }
};

//===================================================================================================================//

// Pure volume -> volume function, applied to image and mask independently.
class DeterministicTransform : public Transform {
  public:
    virtual Volume operator()(const Volume& volume) const = 0;
};

//===================================================================================================================//

/**
 * Stochastic transform applied jointly to keyed volumes ("img", "mask").
 *
 * Each call draws its random parameters exactly once (randomize) and applies the same draw to
 * every key it is configured for, so image and mask keep their spatial correspondence. Keys
 * outside `keys` are passed through unchanged.
 */
class RandomizableTransform : public Transform {
  public:
    explicit RandomizableTransform(float prob = 1.0f,
                                   std::vector<std::string> keys = {IMAGE_KEY, MASK_KEY});

    VolumeDict operator()(const VolumeDict& data);

    // Reseed the internal generator.
    void setRandomState(unsigned int seed);

    float getProbability() const { return this->prob; }
    const std::vector<std::string>& getKeys() const { return this->keys; }

  protected:
    // Draw the parameters for the current call. reference is the image (or first) volume.
    virtual void randomize(const Volume& reference) = 0;

    virtual Volume applyRandomized(const std::string& key, const Volume& volume) const = 0;

    bool appliesTo(const std::string& key) const;

    std::mt19937 rng;
    float prob;
    std::vector<std::string> keys;
    bool doTransform = false;
};

//===================================================================================================================//

enum class TransformKind { RANDOMIZABLE, DETERMINISTIC };

// A configured transform tagged with its kind. The kind is fixed at construction, so callers
// dispatch on kind() instead of probing the transform object.
class TransformEntry {
  public:
    explicit TransformEntry(std::shared_ptr<DeterministicTransform> transform);
    explicit TransformEntry(std::shared_ptr<RandomizableTransform> transform);

    TransformKind kind() const;

    DeterministicTransform& deterministic() const;
    RandomizableTransform& randomizable() const;
    const Transform& transform() const;

  private:
    std::variant<std::shared_ptr<DeterministicTransform>, std::shared_ptr<RandomizableTransform>> value;
};

template <typename T, typename... Args>
TransformEntry makeTransform(Args&&... args) {
  return TransformEntry(std::make_shared<T>(std::forward<Args>(args)...));
}

using Transformations = std::vector<TransformEntry>;

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_TRANSFORM_HPP
