#include <clreport/environment.hpp>

#include <utility>


namespace clreport
{

bool
isNoPlatformError(cl_int err) noexcept
{
  // The ICD loader is present but no vendor driver is registered
  return err == CL_PLATFORM_NOT_FOUND_KHR;
}


bool
isNoDeviceError(cl_int err) noexcept
{
  return err == CL_DEVICE_NOT_FOUND;
}


OpenCLEnvironment::OpenCLEnvironment(cl_device_type deviceType) noexcept
  : deviceType_{deviceType}
{}


std::vector<PlatformInfo>
OpenCLEnvironment::listPlatforms() const
{
  std::vector<cl::Platform> platforms;
  try {
    cl::Platform::get(&platforms);
  } catch (const cl::Error& ex) {
    if (!isNoPlatformError(ex.err())) {
      throw;
    }
    return {};
  }

  std::vector<PlatformInfo> infos;
  infos.reserve(platforms.size());
  for (const auto& platform : platforms) {
    PlatformInfo info;
    info.id = platform();
    info.name = platform.getInfo<CL_PLATFORM_NAME>();
    info.vendor = platform.getInfo<CL_PLATFORM_VENDOR>();
    info.version = platform.getInfo<CL_PLATFORM_VERSION>();
    info.profile = platform.getInfo<CL_PLATFORM_PROFILE>();
    infos.emplace_back(std::move(info));
  }
  return infos;
}


std::vector<DeviceInfo>
OpenCLEnvironment::listDevices(const PlatformInfo& platform) const
{
  std::vector<cl::Device> devices;
  try {
    cl::Platform{platform.id}.getDevices(deviceType_, &devices);
  } catch (const cl::Error& ex) {
    if (!isNoDeviceError(ex.err())) {
      throw;
    }
    return {};
  }

  std::vector<DeviceInfo> infos;
  infos.reserve(devices.size());
  for (const auto& device : devices) {
    DeviceInfo info;
    info.name = device.getInfo<CL_DEVICE_NAME>();
    info.type = device.getInfo<CL_DEVICE_TYPE>();
    info.maxClockFrequency = device.getInfo<CL_DEVICE_MAX_CLOCK_FREQUENCY>();
    info.maxComputeUnits = device.getInfo<CL_DEVICE_MAX_COMPUTE_UNITS>();
    info.localMemSize = device.getInfo<CL_DEVICE_LOCAL_MEM_SIZE>();
    info.maxConstantBufferSize = device.getInfo<CL_DEVICE_MAX_CONSTANT_BUFFER_SIZE>();
    info.globalMemSize = device.getInfo<CL_DEVICE_GLOBAL_MEM_SIZE>();
    info.maxMemAllocSize = device.getInfo<CL_DEVICE_MAX_MEM_ALLOC_SIZE>();
    info.maxWorkGroupSize = device.getInfo<CL_DEVICE_MAX_WORK_GROUP_SIZE>();
    infos.emplace_back(std::move(info));
  }
  return infos;
}

}  // namespace clreport
