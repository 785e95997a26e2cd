/**
 * @file
 *
 * @brief Type definitions used in relation to NVML, NVIDIA's
 * (GPU device) Management Library.
 */
#pragma once
#ifndef CUDAMPS_NVML_TYPES_HPP_
#define CUDAMPS_NVML_TYPES_HPP_

#include "../api/types.hpp"

#include <nvml.h>

namespace cudamps {

namespace nvml {

namespace device {

using handle_t = nvmlDevice_t;

constexpr const handle_t no_handle = nullptr;

} // namespace device

/// The return status of an NVML API call
using status_t = nvmlReturn_t;

} // namespace nvml

} // namespace cudamps

#endif // CUDAMPS_NVML_TYPES_HPP_
