#ifndef CLREPORT_TYPES_HPP
#define CLREPORT_TYPES_HPP

#include <cstddef>
#include <string>

#include <clreport/config/opencl.hpp>


namespace clreport
{

struct PlatformInfo
{
  // nullptr when not backed by a runtime
  cl_platform_id id = nullptr;
  std::string name;
  std::string vendor;
  std::string version;
  std::string profile;
};  // struct PlatformInfo


struct DeviceInfo
{
  std::string name;
  cl_device_type type = 0;
  cl_uint maxClockFrequency = 0;
  cl_uint maxComputeUnits = 0;
  // bytes
  cl_ulong localMemSize = 0;
  cl_ulong maxConstantBufferSize = 0;
  cl_ulong globalMemSize = 0;
  cl_ulong maxMemAllocSize = 0;
  std::size_t maxWorkGroupSize = 0;
};  // struct DeviceInfo

}  // namespace clreport

#endif  // CLREPORT_TYPES_HPP
