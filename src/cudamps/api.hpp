/**
 * @file
 *
 * @brief A single file which includes, in turn, all of the MPS supervisor
 * headers (but not the NVML wrappers; see @ref nvml.hpp ).
 */

#pragma once
#ifndef CUDAMPS_API_HPP_
#define CUDAMPS_API_HPP_

#include "api/types.hpp"
#include "api/constants.hpp"
#include "api/error.hpp"
#include "api/configuration.hpp"
#include "api/logging.hpp"
#include "api/environment.hpp"
#include "api/filesystem.hpp"
#include "api/process.hpp"
#include "api/device_properties.hpp"
#include "api/device.hpp"
#include "api/supervisor.hpp"

#endif // CUDAMPS_API_HPP_
