/**
 * An example program utilizing the environment-handling facilities
 * of the supervisor:
 *
 *   - Extraction of variables from raw environment blocks
 *   - Parsing of visible device lists
 *   - Construction of child environments from overlays
 *   - Configuration defaults and overrides
 *
 * None of this requires a CUDA device.
 */

#include "../common.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <chrono>
#include <fstream>

namespace tests {

void variable_extraction()
{
	static const char raw[] = "CUDA_MPS_PIPE_DIRECTORY=/tmp/x\0OTHER=1";
	std::string block { raw, sizeof(raw) - 1 };
	assert_(cudamps::environment::get(block, "CUDA_MPS_PIPE_DIRECTORY") == "/tmp/x");
	assert_(cudamps::environment::get(block, "OTHER") == "1");
	assert_(cudamps::environment::get(block, "CUDA_VISIBLE_DEVICES").empty());
	assert_(cudamps::environment::get(std::string{}, "OTHER").empty());

	// The name must match an entire variable name, not just a suffix or a prefix of one
	static const char similar[] = "XCUDA_MPS_PIPE_DIRECTORY=/wrong\0CUDA_MPS_PIPE_DIRECTORY_2=/wrong too\0CUDA_MPS_PIPE_DIRECTORY=/right";
	block.assign(similar, sizeof(similar) - 1);
	assert_(cudamps::environment::get(block, "CUDA_MPS_PIPE_DIRECTORY") == "/right");

	// Characters which are special in regular expressions are taken literally
	static const char special[] = "A.B=no\0A+B=yes";
	block.assign(special, sizeof(special) - 1);
	assert_(cudamps::environment::get(block, "A+B") == "yes");
	assert_(cudamps::environment::get(block, "AxB").empty());

	// Values may themselves contain '=' characters, and may be empty
	static const char tricky[] = "OPTIONS=a=b\0EMPTY=";
	block.assign(tricky, sizeof(tricky) - 1);
	assert_(cudamps::environment::get(block, "OPTIONS") == "a=b");
	assert_(cudamps::environment::get(block, "EMPTY").empty());

	// Carriage returns are part of the value
	static const char with_carriage_return[] = "CUDA_MPS_PIPE_DIRECTORY=/tmp/dos\r\0OTHER=1";
	block.assign(with_carriage_return, sizeof(with_carriage_return) - 1);
	assert_(cudamps::environment::get(block, "CUDA_MPS_PIPE_DIRECTORY") == "/tmp/dos\r");
}

void device_lists()
{
	using list = std::vector<cudamps::device::id_t>;
	assert_(cudamps::environment::parse_device_list("0") == list{0});
	assert_(cudamps::environment::parse_device_list("2,0,1") == (list{2, 0, 1}));
	assert_(cudamps::environment::parse_device_list("").empty());
	assert_(cudamps::environment::parse_device_list("GPU-8a3c1f2e").empty());
	assert_(cudamps::environment::parse_device_list("1,oops,2") == list{1});
	// Entries which do not fit a device id end the list, like any other invalid entry
	assert_(cudamps::environment::parse_device_list("4294967296").empty());
	assert_(cudamps::environment::parse_device_list("1,4294967296,2") == list{1});
	assert_(cudamps::environment::parse_device_list("-4294967297").empty());
	assert_(cudamps::environment::parse_device_list("99999999999999999999999").empty());
}

void overlays()
{
	const char* base[] = { "A=1", "B=2", "PATH=/bin", nullptr };
	cudamps::environment_t overlay { { "B", "3" }, { "C", "4" } };
	auto merged = cudamps::environment::merge(base, overlay);
	auto has = [&](const std::string& entry) {
		return std::find(merged.cbegin(), merged.cend(), entry) != merged.cend();
	};
	std::cout << "Merged environment: " << merged << '\n';
	assert_(merged.size() == 4);
	assert_(has("A=1"));
	assert_(has("B=3"));
	assert_(has("C=4"));
	assert_(has("PATH=/bin"));
	assert_(not has("B=2"));

	auto with_own = cudamps::environment::merge(cudamps::environment_t{ { "CUDAMPS_EXAMPLE", "yes" } });
	assert_(std::find(with_own.cbegin(), with_own.cend(), "CUDAMPS_EXAMPLE=yes") != with_own.cend());
	assert_(std::getenv("CUDAMPS_EXAMPLE") == nullptr);
}

void configuration()
{
	cudamps::configuration_t defaults;
	assert_(defaults.daemon_command_line() == "nvidia-cuda-mps-control -d");
	assert_(defaults.launch_timeout == std::chrono::milliseconds(500));
	assert_(defaults.shutdown_timeout == std::chrono::milliseconds(5000));
	assert_(defaults.minimum_compute_capability == cudamps::device::make_compute_capability(3, 5));

	using cudamps::configuration::detail_::parse_milliseconds;
	assert_(parse_milliseconds("SOME_VARIABLE", "250") == std::chrono::milliseconds(250));
	assert_fails_with_(cudamps::status::invalid_configuration, parse_milliseconds("SOME_VARIABLE", "soon"));
	assert_fails_with_(cudamps::status::invalid_configuration, parse_milliseconds("SOME_VARIABLE", "-1"));
	assert_fails_with_(cudamps::status::invalid_configuration, parse_milliseconds("SOME_VARIABLE", "10s"));

	setenv(cudamps::configuration::overrides::control_program, "/opt/mps/control", 1);
	setenv(cudamps::configuration::overrides::launch_timeout, "1500", 1);
	auto overridden = cudamps::configuration_t::from_environment();
	assert_(overridden.control_program == "/opt/mps/control");
	assert_(overridden.daemon_command_line() == "/opt/mps/control -d");
	assert_(overridden.launch_timeout == std::chrono::milliseconds(1500));
	assert_(overridden.shutdown_timeout == defaults.shutdown_timeout);

	setenv(cudamps::configuration::overrides::shutdown_timeout, "eventually", 1);
	assert_fails_with_(cudamps::status::invalid_configuration, cudamps::configuration_t::from_environment());
	unsetenv(cudamps::configuration::overrides::shutdown_timeout);
	unsetenv(cudamps::configuration::overrides::launch_timeout);
	unsetenv(cudamps::configuration::overrides::control_program);
}

void directories()
{
	auto directory = cudamps::filesystem::make_temporary_directory("cudamps-example-");
	std::cout << "Created " << directory << '\n';
	assert_(cudamps::filesystem::is_directory(directory));
	assert_(cudamps::filesystem::join(directory, "a") == directory + "/a");
	assert_(cudamps::filesystem::join(directory + "/", "a") == directory + "/a");

	auto nested = cudamps::filesystem::join(directory, "nested");
	assert_(mkdir(nested.c_str(), 0700) == 0);
	auto file_path = cudamps::filesystem::join(nested, "server.log");
	{
		std::ofstream file { file_path };
		file << "hello\n";
	}
	assert_(cudamps::filesystem::read(file_path) == "hello\n");
	assert_(cudamps::filesystem::read(cudamps::filesystem::join(nested, "missing")).empty());

	cudamps::filesystem::remove_tree(directory);
	assert_(not cudamps::filesystem::is_directory(directory));
	// Removing what's no longer there is not an error
	cudamps::filesystem::remove_tree(directory);
}

} // namespace tests

int main()
{
	tests::variable_extraction();
	tests::device_lists();
	tests::overlays();
	tests::configuration();
	tests::directories();
	std::cout << "\nSUCCESS\n";
}
