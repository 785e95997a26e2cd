/**
 * @file
 *
 * @brief NVML library wrappers for the per-device information the CUDA driver
 * API does not offer: which processes are running on a device as clients of
 * an MPS server.
 *
 * @note NVML device indices need not coincide with CUDA device ids (they are
 * ordered differently unless `CUDA_DEVICE_ORDER=PCI_BUS_ID`, and are unaffected by
 * `CUDA_VISIBLE_DEVICES`); so devices are matched up using their PCI bus id.
 */
#pragma once
#ifndef CUDAMPS_NVML_DEVICE_HPP_
#define CUDAMPS_NVML_DEVICE_HPP_

#include "types.hpp"
#include "error.hpp"
#include "../api/device.hpp"

#include <string>
#include <vector>

namespace cudamps {

namespace nvml {

/**
 * @brief A scope within which the NVML library is initialized
 *
 * @note NVML keeps an initialization reference count, so sessions may be nested
 * (or coexist with other code's use of NVML).
 */
class session_t {
public:
	session_t()
	{
		throw_if_error(nvmlInit_v2(), "Initializing the NVML library");
	}
	session_t(const session_t&) = delete;
	session_t& operator=(const session_t&) = delete;
	~session_t()
	{
		// Failure to shut down is not reportable from a destructor, and leaves nothing to clean up
		nvmlShutdown();
	}
};

namespace device {

namespace detail_ {

inline ::std::string identify(handle_t handle, ::cudamps::device::id_t id)
{
	return "NVML device handle for CUDA " + ::cudamps::device::detail_::identify(id)
		+ (handle == no_handle ? " (unresolved)" : "");
}

inline handle_t get_handle(::cudamps::device::id_t id)
{
	auto pci_bus_id = ::cudamps::device::pci_bus_id(id);
	handle_t result;
	auto status = nvmlDeviceGetHandleByPciBusId_v2(pci_bus_id.c_str(), &result);
	throw_if_nvml_error_lazy(status, "Obtaining an NVML handle for "
		+ ::cudamps::device::detail_::identify(id) + " at PCI bus location " + pci_bus_id);
	return result;
}

inline ::std::vector<nvmlProcessInfo_t> mps_client_processes(handle_t handle, ::cudamps::device::id_t id)
{
	::std::vector<nvmlProcessInfo_t> buffer;
	unsigned int count = 0;
	// The number of processes may grow between the size query and the actual
	// query, in which case we try again with the updated count
	while (true) {
		auto status = nvmlDeviceGetMPSComputeRunningProcesses(handle, &count, buffer.data());
		if (status == NVML_SUCCESS) {
			buffer.resize(count);
			return buffer;
		}
		if (status != NVML_ERROR_INSUFFICIENT_SIZE) {
			throw runtime_error(status, "Obtaining the MPS client processes on " + identify(handle, id));
		}
		buffer.resize(count);
	}
}

} // namespace detail_

/**
 * @brief Lists the processes running on a device as clients of an MPS server
 *
 * @note The caller must hold an @ref session_t for the duration of the call.
 *
 * @return the client process ids, in the order NVML reports them
 */
inline ::std::vector<process::id_t> mps_client_processes(::cudamps::device::id_t id)
{
	auto infos = detail_::mps_client_processes(detail_::get_handle(id), id);
	::std::vector<process::id_t> result;
	result.reserve(infos.size());
	for(const auto& info : infos) {
		result.push_back(static_cast<process::id_t>(info.pid));
	}
	return result;
}

/**
 * @brief The device's compute mode, as NVML reports it
 *
 * @note Should agree with @ref cudamps::device::compute_mode ; NVML, unlike the
 * driver API, does not need to create any driver state to answer.
 */
inline ::cudamps::device::compute_mode_t compute_mode(::cudamps::device::id_t id)
{
	auto handle = detail_::get_handle(id);
	nvmlComputeMode_t mode;
	auto status = nvmlDeviceGetComputeMode(handle, &mode);
	throw_if_nvml_error_lazy(status, "Obtaining the compute mode of " + detail_::identify(handle, id));
	switch(mode) {
	case NVML_COMPUTEMODE_PROHIBITED:        return ::cudamps::device::compute_mode_t::prohibited;
	case NVML_COMPUTEMODE_EXCLUSIVE_PROCESS: return ::cudamps::device::compute_mode_t::exclusive_process;
	default:                                 return ::cudamps::device::compute_mode_t::shared;
	}
}

} // namespace device

} // namespace nvml

} // namespace cudamps

#endif // CUDAMPS_NVML_DEVICE_HPP_
