/**
 * @file
 *
 * @brief The settings governing how a supervisor finds, launches and
 * filters what it works with.
 */
#pragma once
#ifndef CUDAMPS_CONFIGURATION_HPP_
#define CUDAMPS_CONFIGURATION_HPP_

#include "types.hpp"
#include "constants.hpp"
#include "error.hpp"
#include "device_properties.hpp"

#include <cstdlib>
#include <string>
#include <stdexcept>

namespace cudamps {

namespace configuration {

/// Environment variables which, when set, override the defaults
namespace overrides {

constexpr const char* control_program     { "CUDAMPS_CONTROL_PROGRAM" };
constexpr const char* launch_timeout      { "CUDAMPS_LAUNCH_TIMEOUT_MS" };
constexpr const char* shutdown_timeout    { "CUDAMPS_SHUTDOWN_TIMEOUT_MS" };
constexpr const char* device_name_pattern { "CUDAMPS_DEVICE_NAME_PATTERN" };

} // namespace overrides

namespace detail_ {

inline duration_t parse_milliseconds(const char* variable_name, const ::std::string& value)
{
	long long parsed;
	::std::size_t parsed_length;
	try {
		parsed = ::std::stoll(value, &parsed_length);
	}
	catch (const ::std::logic_error&) {
		throw runtime_error(status::invalid_configuration,
			::std::string("Value \"") + value + "\" of " + variable_name + " is not a number of milliseconds");
	}
	if (parsed_length != value.length() or parsed < 0) {
		throw runtime_error(status::invalid_configuration,
			::std::string("Value \"") + value + "\" of " + variable_name + " is not a non-negative number of milliseconds");
	}
	return duration_t{ parsed };
}

} // namespace detail_

} // namespace configuration

/**
 * @brief Settings for a @ref supervisor_t .
 *
 * @note A default-constructed instance matches the behavior of the MPS
 * control program shipped with the CUDA driver.
 */
struct configuration_t {
	/// The control program to launch; looked up on the `PATH` unless it contains a slash
	::std::string control_program { ::cudamps::control_program::default_name };

	/// The argument with which the control program starts as a daemon
	::std::string daemon_flag { ::cudamps::control_program::daemon_flag };

	/// The command written to a control program's standard input to stop its daemon
	::std::string shutdown_command { ::cudamps::control_program::shutdown_command };

	/// Text whose appearance in the output of a daemon launch indicates a conflict
	::std::string already_running_message { ::cudamps::control_program::already_running_message };

	/**
	 * How long to wait for a newly-launched control program to report an immediate
	 * failure; silence for this long is taken to mean it has successfully detached.
	 */
	duration_t launch_timeout { 500 };

	/// How long to wait for a daemon process to exit after it was sent the shutdown command
	duration_t shutdown_timeout { 5000 };

	/// A (POSIX extended) regular expression which names of supported devices must contain a match for
	::std::string device_name_pattern { "Tesla|Quadro" };

	/// The lowest compute capability of a supported device
	device::compute_capability_t minimum_compute_capability { device::make_compute_capability(3, 5) };

	/// The exact command line by which daemon processes are recognized
	::std::string daemon_command_line() const { return control_program + ' ' + daemon_flag; }

	/**
	 * @return the default configuration, with any overrides present in the
	 * process environment applied
	 *
	 * @throws cudamps::runtime_error with @ref status::invalid_configuration
	 * if an override value cannot be parsed
	 */
	static configuration_t from_environment()
	{
		configuration_t result;
		if (auto value = ::std::getenv(configuration::overrides::control_program)) {
			if (*value != '\0') { result.control_program = value; }
		}
		if (auto value = ::std::getenv(configuration::overrides::launch_timeout)) {
			result.launch_timeout = configuration::detail_::parse_milliseconds(
				configuration::overrides::launch_timeout, value);
		}
		if (auto value = ::std::getenv(configuration::overrides::shutdown_timeout)) {
			result.shutdown_timeout = configuration::detail_::parse_milliseconds(
				configuration::overrides::shutdown_timeout, value);
		}
		if (auto value = ::std::getenv(configuration::overrides::device_name_pattern)) {
			result.device_name_pattern = value;
		}
		return result;
	}
};

} // namespace cudamps

#endif // CUDAMPS_CONFIGURATION_HPP_
