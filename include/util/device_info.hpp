#pragma once

#include <string>

namespace aigate {
namespace device {

// Host description sent with device registration.
struct DeviceInfo {
  std::string platform;   // e.g. Linux
  std::string machine;    // e.g. x86_64
  std::string os_version; // PRETTY_NAME from os-release when available

  // "{platform}-{machine}", the deviceModel of a registration request.
  std::string device_model() const;
};

// Best-effort; missing sources fall back to "Unknown".
DeviceInfo gather_device_info();

// PRETTY_NAME value of an os-release style file, empty when absent.
std::string read_os_pretty_name(const std::string &path);

// Lowercase platform tag used in the User-Agent.
const char *platform_tag();

} // namespace device
} // namespace aigate
