#ifndef AUG_CLI_VOLUME_HPP
#define AUG_CLI_VOLUME_HPP

#include "AUG-CLI_Device.hpp"

#include <map>
#include <string>
#include <vector>

#include <sys/types.h>

//===================================================================================================================//

namespace AUG_CLI {

// Spatial information of the file a volume was decoded from. Carried along so transformed
// outputs can be written back with the geometry of their source case.
struct VolumeMetadata {
  std::string space;                           // Physical space, "left-posterior-superior" for 3D ITK images
  std::vector<double> spacing;                 // Per axis, fastest axis first (ITK index order)
  std::vector<double> origin;                  // Empty when unknown
  std::vector<std::vector<double>> directions; // Direction cosines, one unit vector per axis, fastest axis first
  std::string componentType = "float";         // Sample type of the source file ("uint8", "int16", "float", ...)

  bool hasSpace() const { return !this->directions.empty(); }
};

/**
 * Volume: immutable in-memory tensor decoded from an image or mask file.
 *
 * Samples are stored as float in row-major order with the slowest axis first, i.e. a 3D
 * volume has shape {z, y, x} and sample (z, y, x) lives at data[(z * Y + y) * X + x].
 * Operations never modify a volume; they return a new one.
 */
class Volume {
  public:
    Volume() = default;
    Volume(std::vector<ulong> shape, std::vector<float> data, Device device = Device::cpu(),
           VolumeMetadata metadata = {});

    const std::vector<ulong>& shape() const { return this->dims; }
    const std::vector<float>& data() const { return this->samples; }
    const Device& device() const { return this->placement; }
    const VolumeMetadata& metadata() const { return this->meta; }

    ulong ndim() const { return this->dims.size(); }
    ulong size() const { return this->samples.size(); }
    bool empty() const { return this->samples.empty(); }

    // Copy of this volume placed on device.
    Volume to(const Device& device) const;

    // New volume with the same shape, device and metadata but different samples.
    Volume withData(std::vector<float> data) const;

    // New volume with a different shape (e.g. after a 90 degree rotation), same device and metadata.
    Volume withShape(std::vector<ulong> shape, std::vector<float> data) const;

    // Copy of this volume with different spatial metadata.
    Volume withMetadata(VolumeMetadata metadata) const;

    // True if any sample is non-zero.
    bool any() const;

    float min() const;
    float max() const;
    float mean() const;
    float stddev() const;

    // Value equality: shape, samples and device. Metadata is ignored.
    bool operator==(const Volume& other) const;
    bool operator!=(const Volume& other) const { return !(*this == other); }

    // "64x128x128"
    std::string shapeToString() const;

  private:
    std::vector<ulong> dims;
    std::vector<float> samples;
    Device placement;
    VolumeMetadata meta;
};

// Number of samples of a shape. Throws std::runtime_error when the product does not fit in a ulong.
ulong sampleCount(const std::vector<ulong>& shape);

// Keyed volumes handed to randomizable transforms.
using VolumeDict = std::map<std::string, Volume>;

const std::string IMAGE_KEY = "img";
const std::string MASK_KEY = "mask";

} // namespace AUG_CLI

//===================================================================================================================//

#endif // AUG_CLI_VOLUME_HPP
