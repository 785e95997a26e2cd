/**
 * @file
 *
 * @brief Facilities for handling errors originating in NVML,
 * the NVIDIA management library, in an exception-based fashion
 * similar to that of the supervisor and driver API wrappers.
 * Includes a basic exception class for NVML errors, wrapping
 * `::std::runtime_error`.
 */
#pragma once
#ifndef CUDAMPS_NVML_ERROR_HPP_
#define CUDAMPS_NVML_ERROR_HPP_

#include "types.hpp"

#include <type_traits>
#include <string>
#include <stdexcept>

namespace cudamps {

namespace nvml {

namespace status {

/**
 * @brief Aliases for those NVML status codes the wrappers treat specially
 */
enum named_t : ::std::underlying_type<status_t>::type {
	success                                       = NVML_SUCCESS,
	library_not_yet_initialized                   = NVML_ERROR_UNINITIALIZED,
	invalid_argument                              = NVML_ERROR_INVALID_ARGUMENT,
	not_supported_on_device                       = NVML_ERROR_NOT_SUPPORTED,
	user_not_permitted                            = NVML_ERROR_NO_PERMISSION,
	queried_object_not_found                      = NVML_ERROR_NOT_FOUND,
	input_argument_not_large_enough               = NVML_ERROR_INSUFFICIENT_SIZE,
	nvidia_driver_not_loaded                      = NVML_ERROR_DRIVER_NOT_LOADED,
	library_couldnt_be_found_or_loaded            = NVML_ERROR_LIBRARY_NOT_FOUND,
	function_not_implemented_in_this_nvml_version = NVML_ERROR_FUNCTION_NOT_FOUND,
	gpu_device_inaccessible_on_the_bus            = NVML_ERROR_GPU_IS_LOST,
	unknown_internal_error                        = NVML_ERROR_UNKNOWN
};

} // namespace status

/**
 * @brief Determine whether the API call returning the specified status had succeeded
 */
constexpr bool is_success(status_t status)
{
	return (status == static_cast<status_t>(status::named_t::success));
}

/**
 * @brief Determine whether the API call returning the specified status had failed
 */
constexpr bool is_failure(status_t status)
{
	return not is_success(status);
}

/**
 * Obtain a brief textual explanation for a specified NVML API return status / error code.
 */
inline ::std::string describe(status_t status)
{
	const char *result = nvmlErrorString(status);
	if (not result) { return "Unknown error"; }
	return ::std::string{result};
}

/**
 * A class for exceptions raised by the NVML wrappers
 *
 * An NVML error can be constructed with either just an NVML return code,
 * or a code plus an additional message.
 */
class runtime_error : public ::std::runtime_error {
public:
	explicit runtime_error(status_t error_code) :
		::std::runtime_error(describe(error_code)),
		code_(error_code)
	{ }
	runtime_error(status_t error_code, ::std::string what_arg) :
		::std::runtime_error(::std::move(what_arg) + ": " + describe(error_code)),
		code_(error_code)
	{ }

	/**
	 * Obtain the NVML status code which resulted in this error being thrown.
	 */
	status_t code() const { return code_; }

private:
	status_t code_;
};

/**
 * Does nothing - unless the status indicates an error, in which case
 * a @ref cudamps::nvml::runtime_error exception is thrown
 */
inline void throw_if_error(status_t status, const ::std::string& message) noexcept(false)
{
	if (is_failure(status)) { throw runtime_error(status, message); }
}

} // namespace nvml

#define throw_if_nvml_error_lazy(status__, ... ) \
do { \
	::cudamps::nvml::status_t tie_status__ = static_cast<::cudamps::nvml::status_t>(status__); \
	if (::cudamps::nvml::is_failure(tie_status__)) { \
		throw ::cudamps::nvml::runtime_error(tie_status__, (__VA_ARGS__)); \
	} \
} while(false)

} // namespace cudamps

#endif // CUDAMPS_NVML_ERROR_HPP_
