#ifndef CLREPORT_OPTIONS_HPP
#define CLREPORT_OPTIONS_HPP

#include <iosfwd>

#include <clreport/config/opencl.hpp>


namespace clreport
{

struct Options
{
  bool isHelp = false;
  bool isListOnly = false;
  cl_device_type deviceType = CL_DEVICE_TYPE_ALL;
};  // struct Options


//! Throws std::invalid_argument for unknown options, a missing or bad device type
Options
parseOptions(int argc, const char* const argv[]);


void
showUsage(std::ostream& os, const char* progName);

}  // namespace clreport

#endif  // CLREPORT_OPTIONS_HPP
