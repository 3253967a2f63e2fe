#ifndef CLREPORT_ENVIRONMENT_HPP
#define CLREPORT_ENVIRONMENT_HPP

#include <vector>

#include <clreport/config/opencl.hpp>
#include <clreport/types.hpp>


namespace clreport
{

// Every call queries again; failures are thrown as cl::Error.
class ComputeEnvironment
{
public:
  virtual ~ComputeEnvironment() = default;

  virtual std::vector<PlatformInfo>
  listPlatforms() const = 0;

  virtual std::vector<DeviceInfo>
  listDevices(const PlatformInfo& platform) const = 0;
};  // class ComputeEnvironment


class OpenCLEnvironment : public ComputeEnvironment
{
public:
  explicit OpenCLEnvironment(cl_device_type deviceType = CL_DEVICE_TYPE_ALL) noexcept;

  std::vector<PlatformInfo>
  listPlatforms() const override;

  std::vector<DeviceInfo>
  listDevices(const PlatformInfo& platform) const override;

private:
  cl_device_type deviceType_;
};  // class OpenCLEnvironment


// Error codes that mean an empty enumeration rather than a failure
bool
isNoPlatformError(cl_int err) noexcept;

bool
isNoDeviceError(cl_int err) noexcept;

}  // namespace clreport

#endif  // CLREPORT_ENVIRONMENT_HPP
