/**
 * An example program utilizing the process management facilities
 * the supervisor is built on:
 *
 *   - Looking up processes by command line and owner
 *   - Reading the environment of other processes
 *   - Launching child processes, with environment overlays and piped streams
 *
 * This does not require a CUDA device; it does require a POSIX shell, and
 * the `sleep` utility, on the `PATH`.
 */

#include "../common.hpp"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>

namespace tests {

using cudamps::process::launch;
using cudamps::process::launch_options_t;

void terminate(cudamps::process::child_t& child)
{
	kill(child.id(), SIGKILL);
	child.wait();
}

void own_process()
{
	auto own_pid = getpid();
	assert_(not cudamps::process::detail_::read_environment(own_pid).empty());
	assert_(cudamps::process::detail_::read_command_line(own_pid).find("process_management") != std::string::npos);
	auto owner = cudamps::process::detail_::owner(own_pid);
	assert_(owner and *owner == getuid());
	auto all = cudamps::process::detail_::all();
	assert_(std::find(all.cbegin(), all.cend(), own_pid) != all.cend());
	assert_(std::is_sorted(all.cbegin(), all.cend()));
}

void environment_of_child()
{
	auto child = launch({ "sleep", "5" }, { { "CUDAMPS_EXAMPLE_MARKER", "42" } });
	std::cout << "Launched " << cudamps::process::detail_::identify(child.id()) << '\n';
	assert_(cudamps::process::environment_variable(child.id(), "CUDAMPS_EXAMPLE_MARKER") == "42");
	assert_(cudamps::process::environment_variable(child.id(), "CUDAMPS_NO_SUCH_VARIABLE").empty());
	// The launching process' own environment is untouched
	assert_(std::getenv("CUDAMPS_EXAMPLE_MARKER") == nullptr);
	terminate(child);
}

void exited_process()
{
	auto child = launch({ "true" }, {});
	auto pid = child.id();
	assert_(cudamps::process::exited_successfully(child.wait()));
	// Once reaped, the process is gone from the process table (unless its
	// id has been reused in the meantime, which is unlikely)
	assert_(cudamps::process::detail_::read_environment(pid).empty());
	assert_(not cudamps::process::detail_::owner(pid));
	assert_(not cudamps::process::matches(pid, "true", getuid()));
}

void lookup_by_command_line()
{
	auto child = launch({ "sleep", "4.25" }, {});
	auto pid = child.id();
	assert_(cudamps::process::matches(pid, "sleep 4.25", getuid()));
	assert_(not cudamps::process::matches(pid, "sleep 4", getuid()));
	assert_(not cudamps::process::matches(pid, "sleep", getuid()));
	assert_(not cudamps::process::matches(pid, "sleep 4.25", getuid() + 1));
	auto found = cudamps::process::find("sleep 4.25", getuid());
	std::cout << "Processes running \"sleep 4.25\": " << found << '\n';
	assert_(std::find(found.cbegin(), found.cend(), pid) != found.cend());
	terminate(child);
	assert_(not cudamps::process::matches(pid, "sleep 4.25", getuid()));
}

void output_capture()
{
	launch_options_t options;
	options.capture_output = true;
	auto child = launch({ "sh", "-c", "echo out; echo err >&2; exit 3" }, {}, options);
	auto output = child.collect_output(std::chrono::seconds(5));
	assert_(output.complete);
	assert_(output.standard_output == "out\n");
	assert_(output.standard_error == "err\n");
	assert_(output.contains("err"));
	assert_(not output.contains("nothing like it"));
	auto exit_status = child.wait();
	assert_(not cudamps::process::exited_successfully(exit_status));
	assert_(cudamps::process::describe_exit(exit_status) == "exited with status 3");
}

void output_timeout()
{
	launch_options_t options;
	options.capture_output = true;
	auto child = launch({ "sleep", "5" }, {}, options);
	auto start = std::chrono::steady_clock::now();
	auto output = child.collect_output(std::chrono::milliseconds(100));
	auto elapsed = std::chrono::steady_clock::now() - start;
	assert_(not output.complete);
	assert_(output.standard_output.empty() and output.standard_error.empty());
	assert_(elapsed < std::chrono::seconds(4));
	assert_(not child.try_wait());
	terminate(child);
	assert_(cudamps::process::describe_exit(child.wait()) == "was killed by signal " + std::to_string(SIGKILL));
}

void input()
{
	launch_options_t options;
	options.pipe_input = true;
	auto child = launch({ "sh", "-c", "read line; test \"$line\" = hello" }, {}, options);
	child.write_input("hello\n");
	assert_(cudamps::process::exited_successfully(child.wait()));

	auto without_pipe = launch({ "true" }, {});
	assert_fails_with_(cudamps::status::operating_system, without_pipe.write_input("hello\n"));
	without_pipe.wait();
}

void launch_failure()
{
	assert_fails_with_(cudamps::status::launch_failure, launch({ "/nonexistent/cudamps/program" }, {}));
	assert_fails_with_(cudamps::status::launch_failure, launch({ "cudamps-no-such-program-on-the-path" }, {}));
}

} // namespace tests

int main()
{
	tests::own_process();
	tests::environment_of_child();
	tests::exited_process();
	tests::lookup_by_command_line();
	tests::output_capture();
	tests::output_timeout();
	tests::input();
	tests::launch_failure();
	std::cout << "\nSUCCESS\n";
}
