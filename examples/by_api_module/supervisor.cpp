/**
 * An example program utilizing the MPS daemon supervisor:
 *
 *   - Starting daemons for individual devices, and for all supported devices
 *   - Finding running daemons, and the devices and directories they use
 *   - Running a client program against a daemon
 *   - Stopping daemons, with and without removing their directories
 *
 * Rather than the actual MPS control program, this uses a stand-in whose
 * path is provided at build time; and rather than enumerating the system's
 * CUDA devices, it pretends devices 0 and 1 are supported. So it does not
 * require a CUDA device.
 */

#include "../common.hpp"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#ifndef FAKE_MPS_CONTROL_PATH
#error "The path of the stand-in MPS control program must be defined"
#endif

namespace tests {

cudamps::configuration_t make_configuration()
{
	cudamps::configuration_t configuration;
	configuration.control_program = FAKE_MPS_CONTROL_PATH;
	configuration.launch_timeout = std::chrono::seconds(2);
	configuration.shutdown_timeout = std::chrono::seconds(5);
	return configuration;
}

std::vector<cudamps::device::id_t> two_supported_devices()
{
	return { 0, 1 };
}

bool wait_for_file(const std::string& path)
{
	for(int attempt = 0; attempt < 100; attempt++) {
		if (not cudamps::filesystem::read(path).empty()) { return true; }
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
	return false;
}

void nothing_running(const cudamps::supervisor_t& supervisor)
{
	assert_(supervisor.list_running().empty());
	assert_(not supervisor.find_process_by_device(0));
	assert_(supervisor.find_directory_by_device(0).empty());
	assert_(supervisor.supported_devices() == two_supported_devices());
}

void rejected_operations(cudamps::supervisor_t& supervisor)
{
	assert_fails_with_(cudamps::status::unsupported_device, supervisor.start(2));
	assert_fails_with_(cudamps::status::unsupported_device, supervisor.start(-1, "/tmp"));
	assert_(supervisor.list_running().empty());

	// This process has no pipe directory in its environment
	assert_(supervisor.get_pipe_directory(getpid()).empty());
	assert_fails_with_(cudamps::status::no_such_daemon, supervisor.stop(getpid()));

	// ... and a process which has already exited has no environment at all
	auto exited = cudamps::process::launch({ "true" }, {});
	auto exited_pid = exited.id();
	exited.wait();
	assert_fails_with_(cudamps::status::no_such_daemon, supervisor.stop(exited_pid));
}

void start_find_and_stop(cudamps::supervisor_t& supervisor)
{
	auto directory = supervisor.start(0);
	std::cout << "Started a daemon for device 0 using " << directory << '\n';
	assert_(cudamps::filesystem::is_directory(directory));

	auto running = supervisor.list_running();
	assert_(running.size() == 1);
	auto pid = supervisor.find_process_by_device(0);
	assert_(pid);
	assert_(*pid == running.front());
	assert_(supervisor.is_running(*pid));
	assert_(supervisor.get_visible_devices(*pid) == std::vector<cudamps::device::id_t>{0});
	assert_(supervisor.get_pipe_directory(*pid) == directory);
	assert_(supervisor.find_directory_by_device(0) == directory);
	assert_(not supervisor.find_process_by_device(1));
	assert_(wait_for_file(cudamps::filesystem::join(directory, cudamps::daemon::server_log_file_name)));
	std::cout << "Server log:\n" << supervisor.server_log(directory);

	// A second daemon for the same device is refused, without launching anything
	assert_fails_with_(cudamps::status::daemon_already_running, supervisor.start(0));
	assert_(supervisor.list_running().size() == 1);

	// ... as is a second daemon using the same directory, which the control program itself refuses
	assert_fails_with_(cudamps::status::daemon_already_running, supervisor.start(1, directory));
	assert_(supervisor.list_running().size() == 1);

	supervisor.stop(*pid);
	assert_(not supervisor.is_running(*pid));
	assert_(supervisor.list_running().empty());
	assert_(not supervisor.find_process_by_device(0));
	// Without cleaning up, the directory is left behind
	assert_(cudamps::filesystem::is_directory(directory));
	assert_(supervisor.server_log(directory).find("Server exited") != std::string::npos);
	cudamps::filesystem::remove_tree(directory);
}

void provided_directory(cudamps::supervisor_t& supervisor)
{
	auto directory = cudamps::filesystem::make_temporary_directory("cudamps-example-");
	assert_(supervisor.start(1, directory) == directory);
	auto pid = supervisor.find_process_by_device(1);
	assert_(pid);
	assert_(supervisor.get_pipe_directory(*pid) == directory);
	supervisor.stop(*pid, true);
	assert_(not cudamps::filesystem::is_directory(directory));
}

void clients(cudamps::supervisor_t& supervisor)
{
	auto directory = supervisor.start(0);
	auto client_environment = supervisor.client_environment(directory);
	assert_(client_environment.size() == 1);
	assert_(client_environment.at(cudamps::environment::variables::pipe_directory) == directory);

	auto exit_status = supervisor.run_client(directory,
		{ "sh", "-c", "test \"$CUDA_MPS_PIPE_DIRECTORY\" = \"" + directory + "\"" });
	assert_(cudamps::process::exited_successfully(exit_status));
	exit_status = supervisor.run_client(directory, { "sh", "-c", "exit 5" });
	assert_(cudamps::process::describe_exit(exit_status) == "exited with status 5");

	supervisor.stop_all(true);
	assert_(supervisor.list_running().empty());
	assert_(not cudamps::filesystem::is_directory(directory));
}

void all_devices(cudamps::supervisor_t& supervisor)
{
	auto directories = supervisor.start_all();
	assert_(directories.size() == 2);
	assert_(directories[0] != directories[1]);
	assert_(supervisor.list_running().size() == 2);
	assert_(supervisor.find_directory_by_device(0) == directories[0]);
	assert_(supervisor.find_directory_by_device(1) == directories[1]);

	// Starting everything again fails at the first device, leaving the running daemons alone
	assert_fails_with_(cudamps::status::daemon_already_running, supervisor.start_all());
	assert_(supervisor.list_running().size() == 2);

	supervisor.stop_all(true);
	assert_(supervisor.list_running().empty());
	for(const auto& directory : directories) {
		assert_(not cudamps::filesystem::is_directory(directory));
	}
	// Stopping when nothing is running is not an error
	supervisor.stop_all();
}

void failing_control_program()
{
	auto configuration = make_configuration();
	configuration.control_program = "/nonexistent/nvidia-cuda-mps-control";
	cudamps::supervisor_t supervisor { configuration, two_supported_devices };
	auto directory = cudamps::filesystem::make_temporary_directory("cudamps-example-");
	assert_fails_with_(cudamps::status::launch_failure, supervisor.start(0, directory));
	cudamps::filesystem::remove_tree(directory);
}

void failing_shutdown(cudamps::supervisor_t& supervisor)
{
	// A process which seems to use a pipe directory, but has no daemon listening there
	auto directory = cudamps::filesystem::make_temporary_directory("cudamps-example-");
	auto impostor = cudamps::process::launch({ "sleep", "10" },
		{ { cudamps::environment::variables::pipe_directory, directory } });
	assert_(supervisor.get_pipe_directory(impostor.id()) == directory);
	assert_fails_with_(cudamps::status::control_command_failed, supervisor.stop(impostor.id()));
	kill(impostor.id(), SIGKILL);
	impostor.wait();
	cudamps::filesystem::remove_tree(directory);
}

void sparse_supported_devices()
{
	using id_list = std::vector<cudamps::device::id_t>;
	// e.g. device 0 is not a Tesla, while devices 1 and 2 are
	cudamps::supervisor_t supervisor { make_configuration(), []() { return id_list{ 1, 2 }; } };
	assert_(supervisor.list_running().empty());
	assert_fails_with_(cudamps::status::unsupported_device, supervisor.start(0));

	auto directory_1 = supervisor.start(1);
	auto pid_1 = supervisor.find_process_by_device(1);
	assert_(pid_1);
	// The daemon sees its device as the first of the supported ones
	assert_(supervisor.get_visible_devices(*pid_1) == id_list{0});
	assert_(supervisor.find_directory_by_device(1) == directory_1);
	assert_(not supervisor.find_process_by_device(2));

	assert_fails_with_(cudamps::status::daemon_already_running, supervisor.start(1));
	assert_(supervisor.list_running().size() == 1);

	auto directory_2 = supervisor.start(2);
	auto pid_2 = supervisor.find_process_by_device(2);
	assert_(pid_2);
	assert_(*pid_2 != *pid_1);
	assert_(supervisor.get_visible_devices(*pid_2) == id_list{1});
	assert_(supervisor.find_directory_by_device(2) == directory_2);
	assert_(*supervisor.find_process_by_device(1) == *pid_1);
	assert_fails_with_(cudamps::status::daemon_already_running, supervisor.start(2));
	assert_(supervisor.list_running().size() == 2);

	supervisor.stop(*pid_2, true);
	assert_(not supervisor.find_process_by_device(2));
	assert_(*supervisor.find_process_by_device(1) == *pid_1);
	supervisor.stop(*pid_1, true);
	assert_(supervisor.list_running().empty());
	assert_(not cudamps::filesystem::is_directory(directory_1));
	assert_(not cudamps::filesystem::is_directory(directory_2));
}

void slow_shutdown()
{
	static constexpr const char* linger_variable { "FAKE_MPS_CONTROL_LINGER_MS" };
	auto configuration = make_configuration();
	configuration.shutdown_timeout = std::chrono::milliseconds(100);
	cudamps::supervisor_t supervisor { configuration, two_supported_devices };

	setenv(linger_variable, "1500", 1);
	auto directory = supervisor.start(0);
	unsetenv(linger_variable);
	auto pid = supervisor.find_process_by_device(0);
	assert_(pid);

	supervisor.stop(*pid, true);
	// Still running when the shutdown timeout elapsed, so its directory is left alone
	assert_(cudamps::filesystem::is_directory(directory));
	assert_(supervisor.get_pipe_directory(*pid) == directory);

	for(int attempt = 0; attempt < 500 and supervisor.is_running(*pid); attempt++) {
		std::this_thread::sleep_for(std::chrono::milliseconds(20));
	}
	assert_(not supervisor.is_running(*pid));
	assert_(supervisor.server_log(directory).find("Server exited") != std::string::npos);
	cudamps::filesystem::remove_tree(directory);
}

} // namespace tests

int main()
{
	unsetenv(cudamps::environment::variables::pipe_directory);

	cudamps::log::logger()->set_level(spdlog::level::debug);
	cudamps::supervisor_t supervisor { tests::make_configuration(), tests::two_supported_devices };
	std::cout << "Using the control program " << supervisor.configuration().control_program << '\n';

	tests::nothing_running(supervisor);
	tests::rejected_operations(supervisor);
	tests::start_find_and_stop(supervisor);
	tests::provided_directory(supervisor);
	tests::clients(supervisor);
	tests::all_devices(supervisor);
	tests::failing_control_program();
	tests::failing_shutdown(supervisor);
	tests::sparse_supported_devices();
	tests::slow_shutdown();
	tests::nothing_running(supervisor);
	std::cout << "\nSUCCESS\n";
}
