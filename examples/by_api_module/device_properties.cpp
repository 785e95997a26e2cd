/**
 * An example program checking the decisions the supervisor makes about
 * devices based on their properties, using made-up devices; so it does
 * not require a CUDA device.
 */

#include "../common.hpp"

#include <regex>

namespace tests {

using cudamps::device::make_compute_capability;

void compute_capabilities()
{
	auto kepler_35 = make_compute_capability(3, 5);
	assert_(kepler_35.major() == 3);
	assert_(kepler_35.minor() == 5);
	assert_(kepler_35.as_combined_number() == 35);
	assert_(kepler_35.as_string() == "3.5");
	assert_(std::string{kepler_35.architecture.name()} == "Kepler");

	assert_(make_compute_capability(3, 0) < kepler_35);
	assert_(make_compute_capability(2, 1) < kepler_35);
	assert_(make_compute_capability(3, 7) > kepler_35);
	assert_(make_compute_capability(5, 0) > kepler_35);
	assert_(make_compute_capability(5, 0) > make_compute_capability(3, 7));
	assert_(make_compute_capability(3, 5) >= kepler_35);
	assert_(make_compute_capability(3, 5) <= kepler_35);
	assert_(make_compute_capability(3, 5) == kepler_35);
	assert_(make_compute_capability(5, 3) != make_compute_capability(3, 5));
}

void support_decisions()
{
	cudamps::configuration_t configuration;
	std::regex pattern { configuration.device_name_pattern, std::regex::extended };
	auto minimum = configuration.minimum_compute_capability;
	using mode = cudamps::device::compute_mode_t;
	auto device = [](const char* name, unsigned major, unsigned minor) {
		return cudamps::device::properties_t{ 0, name, make_compute_capability(major, minor), mode::exclusive_process };
	};

	assert_(cudamps::device::is_supported(device("Tesla K40m", 3, 5), pattern, minimum));
	assert_(cudamps::device::is_supported(device("Tesla V100-SXM2-16GB", 7, 0), pattern, minimum));
	assert_(cudamps::device::is_supported(device("Quadro RTX 6000", 7, 5), pattern, minimum));
	assert_(not cudamps::device::is_supported(device("Tesla K10.G1.8GB", 3, 0), pattern, minimum));
	assert_(not cudamps::device::is_supported(device("Tesla C2050", 2, 0), pattern, minimum));
	assert_(not cudamps::device::is_supported(device("GeForce GTX 1080", 6, 1), pattern, minimum));
	assert_(not cudamps::device::is_supported(device("NVIDIA A100-SXM4-40GB", 8, 0), pattern, minimum));

	std::regex anything { "A100|Tesla", std::regex::extended };
	assert_(cudamps::device::is_supported(device("NVIDIA A100-SXM4-40GB", 8, 0), anything, minimum));
}

void compute_mode_names()
{
	using mode = cudamps::device::compute_mode_t;
	assert_(std::string{cudamps::device::name(mode::shared)} == "shared");
	assert_(std::string{cudamps::device::name(mode::exclusive_process)} == "exclusive-process");
	assert_(std::string{cudamps::device::name(mode::prohibited)} == "prohibited");
}

} // namespace tests

int main()
{
	tests::compute_capabilities();
	tests::support_decisions();
	tests::compute_mode_names();
	std::cout << "\nSUCCESS\n";
}
