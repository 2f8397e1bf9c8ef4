#ifndef AUG_CLI_DEVICE_HPP
#define AUG_CLI_DEVICE_HPP

#include <string>
#include <unordered_map>

//===================================================================================================================//

namespace AUG_CLI {
  enum class DeviceType {
    CPU,
    GPU,
    UNKNOWN
  };

  const std::unordered_map<std::string, DeviceType> deviceTypeMap = {
    {"cpu", DeviceType::CPU},
    {"gpu", DeviceType::GPU},
  };

  // Placement of a volume for the whole run. index is only meaningful for GPU.
  struct Device {
    DeviceType type = DeviceType::CPU;
    int index = 0;

    static Device cpu() { return Device{}; }
    static Device gpu(int index) { return Device{DeviceType::GPU, index}; }

    // Accepts "CPU", "cpu", "gpu", "gpu:1" and the enumerated form "GPU 1 - <device name>".
    static Device fromSelector(const std::string& selector);

    static DeviceType nameToType(const std::string& name);
    static std::string typeToName(const DeviceType& deviceType);

    // "cpu" or "gpu:<index>"
    std::string toString() const;

    bool operator==(const Device& other) const {
      return this->type == other.type && (this->type == DeviceType::CPU || this->index == other.index);
    }
    bool operator!=(const Device& other) const { return !(*this == other); }
  };
}

//===================================================================================================================//

#endif // AUG_CLI_DEVICE_HPP
