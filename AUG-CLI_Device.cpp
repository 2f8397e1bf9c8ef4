#include "AUG-CLI_Device.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

using namespace AUG_CLI;

//===================================================================================================================//

DeviceType Device::nameToType(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

  auto it = deviceTypeMap.find(lower);

  if (it == deviceTypeMap.end()) {
    return DeviceType::UNKNOWN;
  }

  return it->second;
}

//===================================================================================================================//

std::string Device::typeToName(const DeviceType& deviceType) {
  for (const auto& pair : deviceTypeMap) {
    if (pair.second == deviceType) {
      return pair.first;
    }
  }

  return "unknown";
}

//===================================================================================================================//

Device Device::fromSelector(const std::string& selector) {
  if (Device::nameToType(selector) == DeviceType::CPU) {
    return Device::cpu();
  }

  // "GPU 1 - NVIDIA RTX A4000", "gpu:1", "gpu 1" or plain "gpu"
  static const std::regex gpuPattern(R"(^\s*[gG][pP][uU](?:\s*[:\s]\s*(\d+))?(?:\s*-.*)?\s*$)");
  std::smatch match;

  if (std::regex_match(selector, match, gpuPattern)) {
    int index = match[1].matched ? std::stoi(match[1].str()) : 0;
    return Device::gpu(index);
  }

  throw std::runtime_error("Invalid device: '" + selector + "'. Expected 'CPU' or 'GPU <index>'.");
}

//===================================================================================================================//

std::string Device::toString() const {
  if (this->type == DeviceType::GPU) {
    return "gpu:" + std::to_string(this->index);
  }

  return Device::typeToName(this->type);
}
