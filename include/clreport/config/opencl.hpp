#ifndef CLREPORT_CONFIG_OPENCL_HPP
#define CLREPORT_CONFIG_OPENCL_HPP

#ifndef CL_HPP_ENABLE_EXCEPTIONS
#  define CL_HPP_ENABLE_EXCEPTIONS
#endif  // CL_HPP_ENABLE_EXCEPTIONS

#ifndef CL_HPP_TARGET_OPENCL_VERSION
#  define CL_HPP_TARGET_OPENCL_VERSION 200
#endif  // CL_HPP_TARGET_OPENCL_VERSION

#ifndef CL_HPP_MINIMUM_OPENCL_VERSION
#  define CL_HPP_MINIMUM_OPENCL_VERSION 120
#endif  // CL_HPP_MINIMUM_OPENCL_VERSION

#if defined(__APPLE__) || defined(__MACOSX)
#  include <OpenCL/opencl.hpp>
#else
#  include <CL/opencl.hpp>
#endif  // defined(__APPLE__) || defined(__MACOSX)

#endif  // CLREPORT_CONFIG_OPENCL_HPP
