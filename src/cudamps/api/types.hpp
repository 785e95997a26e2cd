/**
 * @file
 *
 * @brief Fundamental type definitions used throughout the CUDA MPS wrappers.
 *
 * @note In this file you'll find several numeric identifier types, e.g. for
 * processes and devices. These mostly mirror the types the underlying OS and
 * CUDA APIs use, so as to make interaction with the unwrapped APIs easier and
 * to break dependencies in the code.
 */

#pragma once
#ifndef CUDAMPS_TYPES_HPP_
#define CUDAMPS_TYPES_HPP_

#include "detail/preamble.hpp"
#include "detail/optional.hpp"

#include <sys/types.h>

#include <chrono>
#include <map>
#include <string>
#include <vector>

/// @brief Definitions and functionality for supervising CUDA Multi-Process Service daemons.
namespace cudamps {

/**
 * Indicates the result (success or kind of failure) of a supervisor operation.
 *
 * @note See @ref error.hpp for the named values.
 */
using status_t = int;

/**
 * A set of environment variable assignments, applied on top of the inherited
 * environment of a single child process.
 *
 * @note An ordered map, so that the resulting environment block is deterministic.
 */
using environment_t = ::std::map<::std::string, ::std::string>;

/// A command line: the program to execute, followed by its arguments
using command_line_t = ::std::vector<::std::string>;

/// Durations of the bounded waits the supervisor performs
using duration_t = ::std::chrono::milliseconds;

namespace process {

/// An operating-system process identifier
using id_t = ::pid_t;

/// The user a process runs as
using user_id_t = ::uid_t;

/// The raw exit status, as reported by `waitpid()`
using exit_status_t = int;

} // namespace process

namespace device {

/**
 * Numeric ID of a CUDA device used by the CUDA driver API.
 *
 * @note This is signed, since the driver API itself uses `int` (`CUdevice`) for it.
 */
using id_t = int;

} // namespace device

} // namespace cudamps

#endif // CUDAMPS_TYPES_HPP_
