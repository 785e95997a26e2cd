/**
 * A stand-in for `nvidia-cuda-mps-control`, with which the supervisor can be
 * exercised on systems without a GPU (or without MPS).
 *
 * It mimics the parts of the real control program's behavior the supervisor
 * relies on:
 *
 *   fake_mps_control -d   Forks off a background daemon, which runs until it
 *                         is sent a "quit" command; fails, printing the
 *                         "already running" message, if another daemon is
 *                         using the same pipe directory.
 *   fake_mps_control      Forwards the commands on its standard input to the
 *                         daemon using $CUDA_MPS_PIPE_DIRECTORY; fails if there
 *                         is no such daemon.
 *
 * The daemon keeps a FIFO named `control` in its pipe directory, and writes a
 * `server.log` and a `control.log` to its log directory. A daemon started with
 * FAKE_MPS_CONTROL_LINGER_MS set in its environment delays its exit after a
 * "quit" by that many milliseconds.
 */

#include <cudamps/api/constants.hpp>

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

constexpr const char* control_fifo_name { "control" };
constexpr const char* lock_file_name { "control.lock" };

// When set, the daemon takes this many milliseconds to exit after being told to
constexpr const char* linger_variable { "FAKE_MPS_CONTROL_LINGER_MS" };

// A daemon left behind by an aborted test run does not linger forever
constexpr const int idle_timeout_ms { 120 * 1000 };

std::string variable(const char* name)
{
	auto value = std::getenv(name);
	return (value == nullptr) ? std::string{} : std::string{value};
}

std::string in_directory(const std::string& directory, const char* file_name)
{
	return directory + '/' + file_name;
}

[[noreturn]] void fail(const std::string& message)
{
	std::cerr << message << std::endl;
	exit(EXIT_FAILURE);
}

void append_to_log(const std::string& path, const std::string& line)
{
	std::ofstream log { path, std::ios::app };
	log << "[" << getpid() << "] " << line << std::endl;
}

int run_daemon(const std::string& pipe_directory, const std::string& log_directory)
{
	auto fifo_path = in_directory(pipe_directory, control_fifo_name);
	unlink(fifo_path.c_str());
	if (mkfifo(fifo_path.c_str(), 0600) != 0) { return EXIT_FAILURE; }
	// Opened for writing as well, so that there's never an end-of-file between commands
	int fifo = open(fifo_path.c_str(), O_RDWR | O_CLOEXEC);
	if (fifo < 0) { return EXIT_FAILURE; }

	auto server_log = in_directory(log_directory, cudamps::daemon::server_log_file_name);
	auto control_log = in_directory(log_directory, cudamps::daemon::control_log_file_name);
	append_to_log(control_log, "Control daemon started; CUDA_VISIBLE_DEVICES=" + variable("CUDA_VISIBLE_DEVICES"));
	append_to_log(server_log, "Server started");

	std::string pending;
	while (true) {
		struct pollfd fd { fifo, POLLIN, 0 };
		auto num_ready = poll(&fd, 1, idle_timeout_ms);
		if (num_ready < 0 and errno == EINTR) { continue; }
		if (num_ready <= 0) {
			append_to_log(control_log, "Idle for too long, exiting");
			break;
		}
		char buffer[256];
		auto num_read = read(fifo, buffer, sizeof(buffer));
		if (num_read < 0 and errno == EINTR) { continue; }
		if (num_read <= 0) { break; }
		pending.append(buffer, static_cast<std::size_t>(num_read));
		std::string::size_type newline;
		bool quit = false;
		while ((newline = pending.find('\n')) != std::string::npos) {
			auto command = pending.substr(0, newline);
			pending.erase(0, newline + 1);
			append_to_log(control_log, "Received command: " + command);
			if (command == cudamps::control_program::shutdown_command) { quit = true; }
		}
		if (quit) { break; }
	}
	auto linger = variable(linger_variable);
	if (not linger.empty()) {
		append_to_log(control_log, "Lingering for " + linger + " ms");
		usleep(static_cast<useconds_t>(std::atol(linger.c_str())) * 1000);
	}
	append_to_log(server_log, "Server exited");
	close(fifo);
	unlink(fifo_path.c_str());
	return EXIT_SUCCESS;
}

int start_daemon()
{
	auto pipe_directory = variable(cudamps::environment::variables::pipe_directory);
	auto log_directory = variable(cudamps::environment::variables::log_directory);
	if (pipe_directory.empty()) { pipe_directory = "/tmp/nvidia-mps"; }
	if (log_directory.empty()) { log_directory = pipe_directory; }

	auto lock_path = in_directory(pipe_directory, lock_file_name);
	int lock = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
	if (lock < 0) {
		fail("Cannot open " + lock_path + ": " + std::strerror(errno));
	}
	if (flock(lock, LOCK_EX | LOCK_NB) != 0) {
		std::cout << cudamps::control_program::already_running_message << std::endl;
		return EXIT_FAILURE;
	}

	auto pid = fork();
	if (pid < 0) { fail(std::string("fork failed: ") + std::strerror(errno)); }
	if (pid > 0) {
		// The daemon holds on to the lock through its inherited descriptor
		return EXIT_SUCCESS;
	}

	setsid();
	int null_device = open("/dev/null", O_RDWR);
	if (null_device >= 0) {
		dup2(null_device, STDIN_FILENO);
		dup2(null_device, STDOUT_FILENO);
		dup2(null_device, STDERR_FILENO);
		if (null_device > STDERR_FILENO) { close(null_device); }
	}
	exit(run_daemon(pipe_directory, log_directory));
}

int send_commands()
{
	auto pipe_directory = variable(cudamps::environment::variables::pipe_directory);
	if (pipe_directory.empty()) { pipe_directory = "/tmp/nvidia-mps"; }
	auto fifo_path = in_directory(pipe_directory, control_fifo_name);
	int fifo = open(fifo_path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
	if (fifo < 0) {
		fail("Cannot connect to the MPS control daemon at " + pipe_directory + ": " + std::strerror(errno));
	}
	std::ostringstream commands;
	commands << std::cin.rdbuf();
	auto data = commands.str();
	if (not data.empty() and data.back() != '\n') { data += '\n'; }
	auto num_written = write(fifo, data.data(), data.size());
	close(fifo);
	if (num_written != static_cast<ssize_t>(data.size())) {
		fail("Failed sending commands to the MPS control daemon at " + pipe_directory);
	}
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
	if (argc == 2 and std::string{argv[1]} == cudamps::control_program::daemon_flag) {
		return start_daemon();
	}
	if (argc == 1) {
		return send_commands();
	}
	fail(std::string("Usage: ") + argv[0] + " [-d]");
}
