#include <clreport/reporter.hpp>

#include <ostream>

#include <clreport/format.hpp>


namespace clreport
{

namespace
{

constexpr double kKiB = 1024.0;
constexpr double kMiB = 1048576.0;
constexpr double kGiB = 1073741824.0;


inline void
showPlatformInfo(std::ostream& os, int platformIndex, const PlatformInfo& platform)
{
  os << std::string(60, '=') << "\n";
  os << "Platform " << platformIndex << " - Name: " << platform.name << "\n";
  os << "Platform " << platformIndex << " - Vendor: " << platform.vendor << "\n";
  os << "Platform " << platformIndex << " - Version: " << platform.version << "\n";
  os << "Platform " << platformIndex << " - Profile: " << platform.profile << "\n";
}


inline void
showDeviceInfo(std::ostream& os, int deviceIndex, const DeviceInfo& device)
{
  os << " " << std::string(56, '-') << "\n";
  os << "\n";
  const auto prefix = " Device " + std::to_string(deviceIndex) + " - ";
  os << prefix << "Name: " << device.name << "\n";
  os << prefix << "Type: " << deviceTypeToString(device.type) << "\n";
  os << prefix << "Max Clock Speed: " << device.maxClockFrequency << " Mhz\n";
  os << prefix << "Compute Units: " << device.maxComputeUnits << "\n";
  os << prefix << "Local Memory: " << formatScaled(static_cast<double>(device.localMemSize), kKiB) << " KB\n";
  os << prefix << "Constant Memory: " << formatScaled(static_cast<double>(device.maxConstantBufferSize), kKiB) << " KB\n";
  os << prefix << "Global Memory: " << formatScaled(static_cast<double>(device.globalMemSize), kGiB) << " GB\n";
  os << prefix << "Max Buffer/Image Size: " << formatScaled(static_cast<double>(device.maxMemAllocSize), kMiB) << " MB\n";
  os << prefix << "Max Work Group Size: " << formatScaled(static_cast<double>(device.maxWorkGroupSize), 1.0) << "\n";
  os << "\n\n";
}

}  // namespace


std::vector<std::string>
listPlatformSummaries(const ComputeEnvironment& environment, std::ostream& os)
{
  std::vector<std::string> lines;
  int platformIndex = 0;
  for (const auto& platform : environment.listPlatforms()) {
    lines.emplace_back(
      "Platform " + std::to_string(platformIndex)
        + " - Name " + platform.name
        + ", Vendor " + platform.vendor);
    os << lines.back() << "\n";
    platformIndex++;
  }
  os << std::flush;
  return lines;
}


void
printFullReport(const ComputeEnvironment& environment, std::ostream& os)
{
  os << "\n" << std::string(60, '=') << "\nOpenCL Platforms and Devices\n";
  int platformIndex = 0;
  for (const auto& platform : environment.listPlatforms()) {
    showPlatformInfo(os, platformIndex, platform);
    int deviceIndex = 0;
    for (const auto& device : environment.listDevices(platform)) {
      showDeviceInfo(os, deviceIndex, device);
      deviceIndex++;
    }
    platformIndex++;
  }
  os << std::flush;
}

}  // namespace clreport
