#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include <clreport/config/opencl.hpp>
#include <clreport/environment.hpp>
#include <clreport/options.hpp>
#include <clreport/reporter.hpp>


int
main(int argc, const char* argv[])
{
  clreport::Options options;
  try {
    options = clreport::parseOptions(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << std::endl;
    clreport::showUsage(std::cout, argv[0]);
    return EXIT_FAILURE;
  }
  if (options.isHelp) {
    clreport::showUsage(std::cout, argv[0]);
    return EXIT_SUCCESS;
  }

  try {
    const clreport::OpenCLEnvironment environment{options.deviceType};
    if (options.isListOnly) {
      clreport::listPlatformSummaries(environment, std::cout);
    } else {
      clreport::printFullReport(environment, std::cout);
    }
  } catch (const cl::Error& ex) {
    std::cerr << "ERROR: " << ex.what() << "(" << ex.err() << ")" << std::endl;
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
  }
  return EXIT_SUCCESS;
}
