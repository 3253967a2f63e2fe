#ifndef CLREPORT_FORMAT_HPP
#define CLREPORT_FORMAT_HPP

#include <string>

#include <clreport/config/opencl.hpp>


namespace clreport
{

// Several type bits are joined with " | "
std::string
deviceTypeToString(cl_device_type type);


cl_device_type
parseDeviceType(const std::string& name);


std::string
formatScaled(double value, double divisor);

}  // namespace clreport

#endif  // CLREPORT_FORMAT_HPP
