/**
 * @file
 *
 * @brief Wrappers for the CUDA driver API calls the supervisor needs for
 * enumerating local devices and deciding which of them MPS can serve.
 *
 * @note None of these calls create a CUDA context; they only require the driver
 * to have been initialized - which these wrappers ensure.
 */
#pragma once
#ifndef CUDAMPS_DEVICE_HPP_
#define CUDAMPS_DEVICE_HPP_

#include "types.hpp"
#include "error.hpp"
#include "device_properties.hpp"

#include <cuda.h>

#include <cstring>
#include <regex>
#include <string>
#include <vector>

namespace cudamps {

inline void initialize_driver()
{
	static constexpr const unsigned dummy_flags { 0 }; // this is the only allowed value for flags
	throw_if_error(cuInit(dummy_flags), "Failed initializing the CUDA driver");
}

namespace device {

/**
 * Get the number of CUDA devices usable on the system (with the current CUDA
 * library and kernel driver)
 *
 * @note A system without any CUDA device, or without an NVIDIA kernel driver at all,
 * has no devices, rather than failing.
 *
 * @return the number of CUDA devices on this system
 * @throws cudamps::driver::runtime_error if the device count could not be obtained
 */
inline device::id_t count()
{
	static constexpr const unsigned dummy_flags { 0 };
	auto init_status = cuInit(dummy_flags);
	switch(init_status) {
		case CUDA_SUCCESS: break;
		case CUDA_ERROR_NO_DEVICE: return 0;
		default: throw driver::runtime_error(init_status, "Failed initializing the CUDA driver");
	}
	int device_count = 0; // Initializing, just to be on the safe side
	auto status = cuDeviceGetCount(&device_count);
	switch(status) {
		case CUDA_ERROR_NO_DEVICE: return 0;
		case CUDA_SUCCESS: break;
		default: throw driver::runtime_error(status, "Failed obtaining the number of CUDA devices on the system");
	}
	if (device_count < 0) {
		throw ::std::logic_error("cuDeviceGetCount() reports an invalid number of CUDA devices");
	}
	return device_count;
}

namespace detail_ {

inline CUdevice get_handle(id_t id)
{
	CUdevice handle;
	auto status = cuDeviceGet(&handle, id);
	throw_if_driver_error_lazy(status, "Failed obtaining a handle for " + identify(id));
	return handle;
}

inline int get_attribute(id_t id, CUdevice_attribute attribute)
{
	int value;
	auto status = cuDeviceGetAttribute(&value, attribute, get_handle(id));
	throw_if_driver_error_lazy(status, "Failed obtaining attribute " + ::std::to_string(static_cast<int>(attribute))
		+ " of " + identify(id));
	return value;
}

inline ::std::string get_name(id_t id)
{
	using size_type = int; // Yes, an int, that's what cuDeviceGetName takes
	static constexpr const size_type buffer_size { 256 };
	char buffer[buffer_size];
	auto status = cuDeviceGetName(buffer, buffer_size - 1, get_handle(id));
	throw_if_driver_error_lazy(status, "Failed obtaining the CUDA device name of " + identify(id));
	buffer[buffer_size - 1] = '\0';
	return { buffer, ::std::strlen(buffer) };
}

inline ::std::string get_pci_bus_id(id_t id)
{
	// Long enough for the "domain:bus:device.function" format, per the driver API documentation
	static constexpr const int buffer_size { 16 };
	char buffer[buffer_size];
	auto status = cuDeviceGetPCIBusId(buffer, buffer_size, get_handle(id));
	throw_if_driver_error_lazy(status, "Failed obtaining the PCI bus id of " + identify(id));
	buffer[buffer_size - 1] = '\0';
	return { buffer, ::std::strlen(buffer) };
}

} // namespace detail_

/// @return the device's name, e.g. "Tesla V100-SXM2-16GB"
inline ::std::string name(id_t id)
{
	initialize_driver();
	return detail_::get_name(id);
}

/// @return the device's location on the PCI bus, in `domain:bus:device.function` notation
inline ::std::string pci_bus_id(id_t id)
{
	initialize_driver();
	return detail_::get_pci_bus_id(id);
}

inline compute_capability_t compute_capability(id_t id)
{
	initialize_driver();
	auto major = detail_::get_attribute(id, CU_DEVICE_ATTRIBUTE_COMPUTE_CAPABILITY_MAJOR);
	auto minor = detail_::get_attribute(id, CU_DEVICE_ATTRIBUTE_COMPUTE_CAPABILITY_MINOR);
	return make_compute_capability(static_cast<unsigned>(major), static_cast<unsigned>(minor));
}

inline compute_mode_t compute_mode(id_t id)
{
	initialize_driver();
	return static_cast<compute_mode_t>(detail_::get_attribute(id, CU_DEVICE_ATTRIBUTE_COMPUTE_MODE));
}

inline properties_t properties(id_t id)
{
	return { id, name(id), compute_capability(id), compute_mode(id) };
}

/**
 * @brief Decides whether an MPS daemon may be started for a device
 *
 * @param name_pattern a regular expression, a match for which must appear in the device's name
 * @param minimum_compute_capability the least compute capability acceptable
 */
inline bool is_supported(
	const properties_t&          device_properties,
	const ::std::regex&          name_pattern,
	const compute_capability_t&  minimum_compute_capability)
{
	return device_properties.compute_capability >= minimum_compute_capability
		and ::std::regex_search(device_properties.name, name_pattern);
}

/**
 * @brief Lists the devices on this system which MPS daemons may be started for,
 * in increasing order of their ids.
 *
 * @note This is an expensive operation - it initializes the CUDA driver and queries
 * every device - and its result cannot change during the lifetime of a process
 * (CUDA devices aren't hot-pluggable); so callers should cache it.
 */
inline ::std::vector<id_t> supported(
	const ::std::string&         name_pattern,
	const compute_capability_t&  minimum_compute_capability)
{
	::std::regex name_regex { name_pattern, ::std::regex::extended };
	::std::vector<id_t> result;
	auto num_devices = count();
	for(id_t id = 0; id < num_devices; id++) {
		if (is_supported(properties(id), name_regex, minimum_compute_capability)) {
			result.push_back(id);
		}
	}
	return result;
}

} // namespace device

} // namespace cudamps

#endif // CUDAMPS_DEVICE_HPP_
