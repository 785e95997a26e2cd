/**
 * @file
 *
 * @brief Facilities for exception-based handling of failures of the
 * supervisor's operations, and of the CUDA driver API calls it makes;
 * including basic exception classes wrapping `::std::runtime_error`.
 *
 * @note Read-only queries regarding daemons do not throw when what they
 * look for is absent: other tools may start and stop daemons at any time,
 * so absence is a normal result rather than an error. Only the operations
 * which launch external programs, and the device queries, throw.
 */
#pragma once
#ifndef CUDAMPS_ERROR_HPP_
#define CUDAMPS_ERROR_HPP_

#include "types.hpp"

#include <cuda.h>

#include <cerrno>
#include <cstring>
#include <type_traits>
#include <string>
#include <stdexcept>

namespace cudamps {

namespace status {

/**
 * Named supervisor status codes
 */
enum named_t : status_t {
	success                = 0,
	/// A pid does not belong to a daemon whose pipe directory can be read
	no_such_daemon         = 1,
	/// A device not among the supported devices was requested
	unsupported_device     = 2,
	/// Either the supervisor found a daemon for the device, or the control program reported a conflict
	daemon_already_running = 3,
	/// The control program could not be executed at all
	launch_failure         = 4,
	/// The control program ran, but rejected a control command
	control_command_failed = 5,
	/// An OS facility (pipes, forking, directories) failed; see the message for the errno description
	operating_system       = 6,
	/// A configuration value could not be parsed or is out of range
	invalid_configuration  = 7,
};

} // namespace status

/**
 * @brief Determine whether an operation resulting in the specified status had succeeded
 */
constexpr inline bool is_success(status_t status)  { return status == static_cast<status_t>(status::success); }

/**
 * @brief Determine whether an operation resulting in the specified status had failed
 */
constexpr inline bool is_failure(status_t status)  { return not is_success(status); }

/**
 * Obtain a brief textual explanation for a specified kind of supervisor status.
 */
inline ::std::string describe(status_t status)
{
	using named = status::named_t;
	switch(static_cast<named>(status)) {
	case named::success:                return "success";
	case named::no_such_daemon:         return "no such MPS control daemon process";
	case named::unsupported_device:     return "device not supported";
	case named::daemon_already_running: return "MPS control daemon already running";
	case named::launch_failure:         return "failed launching the MPS control program";
	case named::control_command_failed: return "the MPS control program failed executing a command";
	case named::operating_system:       return "operating system error";
	case named::invalid_configuration:  return "invalid configuration";
	}
	return "unknown status " + ::std::to_string(status);
}

/**
 * A (base) class for exceptions raised by the supervisor and the process
 * facilities it uses.
 *
 * A supervisor error can be constructed with either just a status code,
 * or a code plus an additional message.
 */
class runtime_error : public ::std::runtime_error {
public:
	explicit runtime_error(status::named_t error_code) :
		::std::runtime_error(describe(error_code)), code_(error_code)
	{ }
	runtime_error(status::named_t error_code, const ::std::string& what_arg) :
		::std::runtime_error(what_arg + ": " + describe(error_code)),
		code_(error_code)
	{ }

	/**
	 * Obtain the status code which resulted in this error being thrown.
	 */
	status_t code() const { return code_; }

private:
	status_t code_;
};

/**
 * Throws a @ref cudamps::runtime_error for a failed OS call, describing the
 * current value of `errno` as part of the message.
 *
 * @note call this immediately after the failed call, before anything else
 * can overwrite `errno`.
 */
[[noreturn]] inline void throw_os_error(const ::std::string& message)
{
	auto errno_description = ::std::strerror(errno);
	throw runtime_error(status::operating_system, message + " (" + errno_description + ")");
}

namespace driver {

/// The status type of CUDA driver API calls
using status_t = CUresult;

/**
 * Obtain a brief textual explanation for a CUDA driver API status code
 */
inline ::std::string describe(status_t status)
{
	const char* description;
	auto description_lookup_status = cuGetErrorString(status, &description);
	return (description_lookup_status != CUDA_SUCCESS) ?
		"unknown CUDA driver status " + ::std::to_string(static_cast<int>(status)) : description;
}

/**
 * The exception thrown when a CUDA driver API call fails
 */
class runtime_error : public ::std::runtime_error {
public:
	explicit runtime_error(status_t error_code) :
		::std::runtime_error(describe(error_code)), code_(error_code)
	{ }
	runtime_error(status_t error_code, const ::std::string& what_arg) :
		::std::runtime_error(what_arg + ": " + describe(error_code)),
		code_(error_code)
	{ }

	/**
	 * Obtain the CUDA driver status code which resulted in this error being thrown.
	 */
	status_t code() const { return code_; }

private:
	status_t code_;
};

} // namespace driver

/**
 * Do nothing... unless the CUDA driver status indicates an error, in which case
 * a @ref cudamps::driver::runtime_error exception is thrown
 *
 * @param status should be `CUDA_SUCCESS` - otherwise an exception is thrown
 * @param message An extra description message to add to the exception
 */
inline void throw_if_error(driver::status_t status, const ::std::string& message) noexcept(false)
{
	if (status != CUDA_SUCCESS) { throw driver::runtime_error(status, message); }
}

/**
 * A variant of @ref throw_if_error which only constructs the message
 * (a possibly-expensive string concatenation) when there actually is an error.
 */
#define throw_if_driver_error_lazy(status__, ... ) \
do { \
	::cudamps::driver::status_t tie_status__ = static_cast<::cudamps::driver::status_t>(status__); \
	if (tie_status__ != CUDA_SUCCESS) { \
		throw ::cudamps::driver::runtime_error(tie_status__, (__VA_ARGS__)); \
	} \
} while(false)

// The following few functions are used in the error messages
// generated for exceptions thrown by various wrappers.

namespace device {
namespace detail_ {
inline ::std::string identify(device::id_t device_id)
{
	return ::std::string("device ") + ::std::to_string(device_id);
}
} // namespace detail_
} // namespace device

namespace process {
namespace detail_ {
inline ::std::string identify(process::id_t pid)
{
	return ::std::string("process ") + ::std::to_string(pid);
}
} // namespace detail_
} // namespace process

} // namespace cudamps

#endif // CUDAMPS_ERROR_HPP_
