#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <clreport/options.hpp>


namespace
{

clreport::Options
parse(const std::vector<const char*>& args)
{
  std::vector<const char*> argv{"CxxPlatformReport"};
  argv.insert(argv.end(), args.begin(), args.end());
  return clreport::parseOptions(static_cast<int>(argv.size()), argv.data());
}

}  // namespace


TEST(ParseOptionsTest, Defaults) {
  const auto options = parse({});
  EXPECT_FALSE(options.isHelp);
  EXPECT_FALSE(options.isListOnly);
  EXPECT_EQ(options.deviceType, static_cast<cl_device_type>(CL_DEVICE_TYPE_ALL));
}

TEST(ParseOptionsTest, ListOnly) {
  EXPECT_TRUE(parse({"-l"}).isListOnly);
  EXPECT_TRUE(parse({"--list"}).isListOnly);
}

TEST(ParseOptionsTest, Help) {
  EXPECT_TRUE(parse({"-h"}).isHelp);
  EXPECT_TRUE(parse({"--help"}).isHelp);
  // Help wins over anything after it
  EXPECT_TRUE(parse({"-l", "--help", "--bogus"}).isHelp);
}

TEST(ParseOptionsTest, DeviceTypeForms) {
  EXPECT_EQ(parse({"-t", "gpu"}).deviceType, static_cast<cl_device_type>(CL_DEVICE_TYPE_GPU));
  EXPECT_EQ(parse({"--device-type", "cpu"}).deviceType, static_cast<cl_device_type>(CL_DEVICE_TYPE_CPU));
  EXPECT_EQ(parse({"--device-type=accelerator"}).deviceType, static_cast<cl_device_type>(CL_DEVICE_TYPE_ACCELERATOR));

  const auto options = parse({"-l", "-t", "default"});
  EXPECT_TRUE(options.isListOnly);
  EXPECT_EQ(options.deviceType, static_cast<cl_device_type>(CL_DEVICE_TYPE_DEFAULT));
}

TEST(ParseOptionsTest, BadDeviceTypeThrows) {
  EXPECT_THROW(parse({"-t", "fpga"}), std::invalid_argument);
  EXPECT_THROW(parse({"--device-type="}), std::invalid_argument);
  EXPECT_THROW(parse({"--device-type=GPU"}), std::invalid_argument);
}

TEST(ParseOptionsTest, MissingDeviceTypeThrows) {
  EXPECT_THROW(parse({"-t"}), std::invalid_argument);
  EXPECT_THROW(parse({"-l", "--device-type"}), std::invalid_argument);
}

TEST(ParseOptionsTest, UnknownOptionThrows) {
  try {
    parse({"--verbose"});
    FAIL() << "std::invalid_argument was not thrown";
  } catch (const std::invalid_argument& ex) {
    EXPECT_EQ(std::string{ex.what()}, "Unknown option: --verbose");
  }
  EXPECT_THROW(parse({"extra"}), std::invalid_argument);
}

TEST(ShowUsageTest, ListsEveryOption) {
  std::ostringstream oss;
  clreport::showUsage(oss, "CxxPlatformReport");
  const auto usage = oss.str();
  EXPECT_NE(usage.find("$ CxxPlatformReport [options]"), std::string::npos);
  EXPECT_NE(usage.find("-l, --list"), std::string::npos);
  EXPECT_NE(usage.find("--device-type=DEVICE_TYPE"), std::string::npos);
  EXPECT_NE(usage.find("-h, --help"), std::string::npos);
}
