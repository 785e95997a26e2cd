/**
 * @file
 *
 * @brief A single file which includes, in turn, all of the NVIDIA management
 * library wrappers the supervisor tools use.
 */

#pragma once
#ifndef CUDAMPS_NVML_WRAPPERS_HPP_
#define CUDAMPS_NVML_WRAPPERS_HPP_

#include "nvml/types.hpp"
#include "nvml/error.hpp"
#include "nvml/device.hpp"

#endif // CUDAMPS_NVML_WRAPPERS_HPP_
