/**
 * An example program utilizing the device-related calls the supervisor
 * makes, through the CUDA driver API and NVML:
 *
 *   - Device enumeration and identification
 *   - Compute capabilities and compute modes
 *   - Determination of the devices MPS can serve
 *   - Listing of MPS client processes
 *
 * Requires a CUDA device; exits with the "skipped" status when there is none.
 */

#include "../common.hpp"

#include <cudamps/nvml.hpp>

#include <algorithm>
#include <regex>

namespace tests {

void basics(cudamps::device::id_t device_id)
{
	auto properties = cudamps::device::properties(device_id);
	std::cout
		<< "Device " << device_id << ": " << properties.name
		<< ", compute capability " << properties.compute_capability
		<< ", compute mode " << cudamps::device::name(properties.compute_mode) << '\n';
	assert_(properties.id == device_id);
	assert_(not properties.name.empty());
	assert_(properties.name == cudamps::device::name(device_id));
	assert_(properties.compute_capability == cudamps::device::compute_capability(device_id));
	assert_(properties.compute_capability.major() >= 1);

	auto pci_bus_id = cudamps::device::pci_bus_id(device_id);
	std::cout << "PCI bus id: " << pci_bus_id << '\n';
	// domain:bus:device.function
	assert_(std::regex_match(pci_bus_id, std::regex{"[0-9a-fA-F]+:[0-9a-fA-F]+:[0-9a-fA-F]+\\.[0-9a-fA-F]+"}));
}

void supported_devices(cudamps::device::id_t num_devices)
{
	cudamps::configuration_t configuration;
	auto supported = cudamps::device::supported(configuration.device_name_pattern, configuration.minimum_compute_capability);
	std::cout << "Devices supporting MPS: " << supported << '\n';
	assert_(std::is_sorted(supported.cbegin(), supported.cend()));
	for(auto device_id : supported) {
		assert_(device_id >= 0 and device_id < num_devices);
		assert_(cudamps::device::compute_capability(device_id) >= configuration.minimum_compute_capability);
	}

	// With no restriction on the name or the compute capability, every device is supported
	auto all = cudamps::device::supported(".", cudamps::device::make_compute_capability(1, 0));
	assert_(all.size() == static_cast<std::size_t>(num_devices));

	// The supervisor's cached list agrees with a direct enumeration
	cudamps::supervisor_t supervisor { configuration };
	assert_(supervisor.supported_devices() == supported);
	assert_(&supervisor.supported_devices() == &supervisor.supported_devices());
}

void nvml_queries(cudamps::device::id_t device_id)
{
	cudamps::nvml::session_t nvml_session;
	auto compute_mode = cudamps::nvml::device::compute_mode(device_id);
	assert_(compute_mode == cudamps::device::compute_mode(device_id));
	try {
		auto clients = cudamps::nvml::device::mps_client_processes(device_id);
		std::cout << "MPS client processes on device " << device_id << ": " << clients << '\n';
	}
	catch (const cudamps::nvml::runtime_error& ex) {
		if (ex.code() != static_cast<cudamps::nvml::status_t>(cudamps::nvml::status::not_supported_on_device)) {
			throw;
		}
		std::cout << "Listing MPS clients is not supported on device " << device_id << '\n';
	}
}

} // namespace tests

int main()
{
	auto num_devices = cudamps::device::count();
	if (num_devices == 0) {
		skip_("No CUDA devices on this system");
	}
	std::cout << "There are " << num_devices << " CUDA devices on this system\n";
	for(cudamps::device::id_t device_id = 0; device_id < num_devices; device_id++) {
		tests::basics(device_id);
		tests::nvml_queries(device_id);
	}
	tests::supported_devices(num_devices);
	std::cout << "\nSUCCESS\n";
}
