/**
 * An example program running the cudamps-ctl command-line tool, checking its
 * exit statuses and output:
 *
 *   - 0 on success, 1 when an operation fails and 2 on usage errors
 *   - Listing, inspecting and stopping daemons started through the library
 *
 * Like the supervisor example, it uses the stand-in MPS control program, and
 * only invokes commands which do not require a CUDA device.
 */

#include "../../common.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <chrono>

#ifndef CUDAMPS_CTL_PATH
#error "The path of the cudamps-ctl tool must be defined"
#endif

#ifndef FAKE_MPS_CONTROL_PATH
#error "The path of the stand-in MPS control program must be defined"
#endif

namespace tests {

struct invocation_result_t {
	int exit_code;
	cudamps::process::output_t output;
};

invocation_result_t invoke(const cudamps::command_line_t& arguments)
{
	cudamps::command_line_t command_line { CUDAMPS_CTL_PATH, "--control-program", FAKE_MPS_CONTROL_PATH };
	command_line.insert(command_line.end(), arguments.cbegin(), arguments.cend());
	cudamps::process::launch_options_t options;
	options.capture_output = true;
	auto child = cudamps::process::launch(command_line, {}, options);
	auto output = child.collect_output(std::chrono::seconds(10));
	auto exit_status = child.wait();
	assert_(output.complete);
	if (not WIFEXITED(exit_status)) {
		die_(std::string{CUDAMPS_CTL_PATH} + " " + cudamps::process::describe_exit(exit_status));
	}
	std::cout << "cudamps-ctl";
	for(const auto& argument : arguments) { std::cout << ' ' << argument; }
	std::cout << " : exit code " << WEXITSTATUS(exit_status) << '\n';
	return { WEXITSTATUS(exit_status), output };
}

cudamps::configuration_t make_configuration()
{
	cudamps::configuration_t configuration;
	configuration.control_program = FAKE_MPS_CONTROL_PATH;
	configuration.launch_timeout = std::chrono::seconds(2);
	configuration.shutdown_timeout = std::chrono::seconds(5);
	return configuration;
}

std::vector<cudamps::device::id_t> one_supported_device()
{
	return { 0 };
}

void usage_errors()
{
	assert_(invoke({}).exit_code == 2);
	auto result = invoke({ "frobnicate" });
	assert_(result.exit_code == 2);
	assert_(result.output.standard_error.find("Unknown command frobnicate") != std::string::npos);
	assert_(result.output.standard_error.find("Usage") != std::string::npos);

	result = invoke({ "--help" });
	assert_(result.exit_code == 0);
	assert_(result.output.standard_output.find("Usage") != std::string::npos);

	assert_(invoke({ "stop" }).exit_code == 2);
	assert_(invoke({ "log" }).exit_code == 2);
	assert_(invoke({ "list", "extra" }).exit_code == 2);
	assert_(invoke({ "--no-such-option", "list" }).exit_code == 2);
	assert_(invoke({ "--launch-timeout-ms", "-1", "list" }).exit_code == 2);

	result = invoke({ "--log-level", "bogus", "list" });
	assert_(result.exit_code == 2);
	assert_(result.output.standard_error.find("Invalid log level bogus") != std::string::npos);
	assert_(invoke({ "--log-level", "off", "list" }).exit_code == 0);
	assert_(invoke({ "--log-level", "debug", "list" }).exit_code == 0);
}

void nothing_running()
{
	auto result = invoke({ "list" });
	assert_(result.exit_code == 0);
	assert_(result.output.standard_output.empty());
	// Stopping when nothing is running is not an error
	assert_(invoke({ "stop", "--all" }).exit_code == 0);
}

void inspect_and_stop(cudamps::supervisor_t& supervisor)
{
	auto directory = supervisor.start(0);
	auto pid = supervisor.find_process_by_device(0);
	assert_(pid);
	auto pid_str = std::to_string(*pid);

	auto result = invoke({ "list" });
	assert_(result.exit_code == 0);
	assert_(result.output.standard_output == pid_str + "\t0\t" + directory + "\n");

	result = invoke({ "log", "--pid", pid_str });
	assert_(result.exit_code == 0);
	assert_(result.output.standard_output.find("Server started") != std::string::npos);

	// This process is not a daemon, nor does it have a pipe directory
	auto own_pid = std::to_string(getpid());
	assert_(invoke({ "log", "--pid", own_pid }).exit_code == 1);
	assert_(invoke({ "stop", "--pid", own_pid }).exit_code == 1);
	assert_(supervisor.is_running(*pid));

	assert_(invoke({ "stop", "--pid", pid_str }).exit_code == 0);
	assert_(not supervisor.is_running(*pid));
	assert_(supervisor.list_running().empty());
	assert_(cudamps::filesystem::is_directory(directory));
	cudamps::filesystem::remove_tree(directory);
}

void stop_all_and_clean(cudamps::supervisor_t& supervisor)
{
	auto directory = supervisor.start(0);
	assert_(supervisor.list_running().size() == 1);

	assert_(invoke({ "stop", "--all", "--clean" }).exit_code == 0);
	assert_(supervisor.list_running().empty());
	assert_(not cudamps::filesystem::is_directory(directory));
	assert_(invoke({ "list" }).output.standard_output.empty());
}

} // namespace tests

int main()
{
	unsetenv(cudamps::environment::variables::pipe_directory);
	// The tool's own logging level is only set by what each invocation passes
	unsetenv("SPDLOG_LEVEL");

	cudamps::supervisor_t supervisor { tests::make_configuration(), tests::one_supported_device };
	assert_(supervisor.list_running().empty());

	tests::usage_errors();
	tests::nothing_running();
	tests::inspect_and_stop(supervisor);
	tests::stop_all_and_clean(supervisor);
	tests::nothing_running();
	std::cout << "\nSUCCESS\n";
}
