#include "util/device_info.hpp"

#include <fstream>
#if !defined(_WIN32)
#include <sys/utsname.h>
#endif

namespace aigate {
namespace device {

namespace {

std::string parse_platform() {
#if defined(__ANDROID__)
  return "Android";
#elif defined(__linux__)
  return "Linux";
#elif defined(__APPLE__)
  return "macOS";
#elif defined(_WIN32) || defined(_WIN64)
  return "Windows";
#else
  return "Unknown";
#endif
}

std::string parse_machine() {
#if !defined(_WIN32)
  struct utsname uts {};
  if (::uname(&uts) == 0 && uts.machine[0] != '\0') {
    return uts.machine;
  }
#endif
  return "Unknown";
}

} // namespace

std::string DeviceInfo::device_model() const {
  return platform + "-" + machine;
}

std::string read_os_pretty_name(const std::string &path) {
  std::ifstream os_release(path);
  if (!os_release.is_open()) {
    return {};
  }
  std::string line;
  while (std::getline(os_release, line)) {
    if (line.rfind("PRETTY_NAME=", 0) == 0) {
      std::string v = line.substr(12);
      if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
      }
      return v;
    }
  }
  return {};
}

DeviceInfo gather_device_info() {
  DeviceInfo info;
  info.platform = parse_platform();
  info.machine = parse_machine();
  info.os_version = read_os_pretty_name("/etc/os-release");
  if (info.os_version.empty()) {
    info.os_version = read_os_pretty_name("/usr/lib/os-release");
  }
  if (info.os_version.empty()) {
    info.os_version = "Unknown";
  }
  return info;
}

const char *platform_tag() {
#if defined(__ANDROID__)
  return "android";
#elif defined(__linux__)
  return "linux";
#elif defined(__APPLE__)
  return "macos";
#elif defined(_WIN32)
  return "windows";
#else
  return "unknown";
#endif
}

} // namespace device
} // namespace aigate
