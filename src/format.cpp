#include <clreport/format.hpp>

#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>


namespace clreport
{

namespace
{

const std::pair<cl_device_type, const char*> kDeviceTypeLabels[] = {
  {CL_DEVICE_TYPE_DEFAULT, "DEFAULT"},
  {CL_DEVICE_TYPE_CPU, "CPU"},
  {CL_DEVICE_TYPE_GPU, "GPU"},
  {CL_DEVICE_TYPE_ACCELERATOR, "ACCELERATOR"},
  {CL_DEVICE_TYPE_CUSTOM, "CUSTOM"}
};

}  // namespace


std::string
deviceTypeToString(cl_device_type type)
{
  if (type == CL_DEVICE_TYPE_ALL) {
    return "ALL";
  }

  std::string label;
  cl_device_type known = 0;
  for (const auto& entry : kDeviceTypeLabels) {
    if ((type & entry.first) == 0) {
      continue;
    }
    if (!label.empty()) {
      label += " | ";
    }
    label += entry.second;
    known |= entry.first;
  }

  if (label.empty() || known != type) {
    std::ostringstream oss;
    oss << "UNKNOWN (0x" << std::hex << type << ")";
    return oss.str();
  }
  return label;
}


cl_device_type
parseDeviceType(const std::string& name)
{
  static const std::unordered_map<std::string, cl_device_type> kDeviceTypeMap{
    {"all", CL_DEVICE_TYPE_ALL},
    {"default", CL_DEVICE_TYPE_DEFAULT},
    {"cpu", CL_DEVICE_TYPE_CPU},
    {"gpu", CL_DEVICE_TYPE_GPU},
    {"accelerator", CL_DEVICE_TYPE_ACCELERATOR},
    {"custom", CL_DEVICE_TYPE_CUSTOM}
  };

  const auto itr = kDeviceTypeMap.find(name);
  if (itr == std::end(kDeviceTypeMap)) {
    throw std::invalid_argument{"Unknown device type: " + name};
  }
  return itr->second;
}


std::string
formatScaled(double value, double divisor)
{
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(0) << (value / divisor);
  return oss.str();
}

}  // namespace clreport
