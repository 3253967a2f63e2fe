#include <clreport/options.hpp>

#include <ostream>
#include <stdexcept>
#include <string>

#include <clreport/format.hpp>


namespace clreport
{

namespace
{

const std::string kDeviceTypePrefix{"--device-type="};

}  // namespace


Options
parseOptions(int argc, const char* const argv[])
{
  Options options;
  for (int i = 1; i < argc; i++) {
    const std::string arg{argv[i]};
    if (arg == "-h" || arg == "--help") {
      options.isHelp = true;
      return options;
    } else if (arg == "-l" || arg == "--list") {
      options.isListOnly = true;
    } else if (arg == "-t" || arg == "--device-type") {
      if (i + 1 >= argc) {
        throw std::invalid_argument{"Option requires an argument: " + arg};
      }
      options.deviceType = parseDeviceType(argv[++i]);
    } else if (arg.compare(0, kDeviceTypePrefix.size(), kDeviceTypePrefix) == 0) {
      options.deviceType = parseDeviceType(arg.substr(kDeviceTypePrefix.size()));
    } else {
      throw std::invalid_argument{"Unknown option: " + arg};
    }
  }
  return options;
}


void
showUsage(std::ostream& os, const char* progName)
{
  os << "[Usage]\n"
     << "  $ " << progName << " [options]\n\n"
     << "[Options]\n"
     << "  -l, --list\n"
     << "    List up all platforms only\n"
     << "  -t DEVICE_TYPE, --device-type=DEVICE_TYPE\n"
     << "    Specify device type (default: all)\n"
     << "      all: All devices\n"
     << "      default: Default device only\n"
     << "      cpu: CPU only\n"
     << "      gpu: GPU only\n"
     << "      accelerator: Accelerator only\n"
     << "      custom: Custom device only\n"
     << "  -h, --help\n"
     << "    Show help and exit this program\n"
     << std::flush;
}

}  // namespace clreport
