/**
 * @file
 *
 * @brief Facilities for finding processes in the OS process table,
 * inspecting them through `/proc`, and launching child processes with
 * an explicit environment and (optionally) piped standard streams.
 *
 * @note Nothing here keeps track of processes between calls: every
 * query re-reads the process table.
 */
#pragma once
#ifndef CUDAMPS_PROCESS_HPP_
#define CUDAMPS_PROCESS_HPP_

#include "types.hpp"
#include "error.hpp"
#include "environment.hpp"
#include "filesystem.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace cudamps {

namespace process {

namespace detail_ {

constexpr const char* proc_root { "/proc" };

inline ::std::string proc_path(id_t pid, const char* entry = nullptr)
{
	auto result = ::std::string(proc_root) + '/' + ::std::to_string(pid);
	return entry == nullptr ? result : result + '/' + entry;
}

/**
 * @brief Obtains the raw environment block of a process.
 *
 * @return NUL-separated `NAME=value` entries, as the process was started with
 * them (later changes the process makes to its own environment are not
 * reflected); an empty string if the process does not exist, has
 * exited meanwhile, or its environment may not be read by this user.
 */
inline ::std::string read_environment(id_t pid)
{
	return filesystem::read(proc_path(pid, "environ"));
}

/**
 * @brief Obtains a process' command line, with its arguments separated by
 * single spaces - the way `pgrep -f` matches against it.
 *
 * @note Zombie processes, and kernel threads, have empty command lines.
 */
inline ::std::string read_command_line(id_t pid)
{
	auto raw = filesystem::read(proc_path(pid, "cmdline"));
	while (not raw.empty() and raw.back() == '\0') { raw.pop_back(); }
	::std::replace(raw.begin(), raw.end(), '\0', ' ');
	return raw;
}

/**
 * @return the (effective) user owning a process, if it still exists
 */
inline optional<user_id_t> owner(id_t pid)
{
	struct stat status;
	if (::stat(proc_path(pid).c_str(), &status) != 0) { return nullopt; }
	return status.st_uid;
}

/**
 * @return the ids of all processes currently in the process table, in increasing order
 */
inline ::std::vector<id_t> all()
{
	::std::vector<id_t> result;
	auto directory = ::opendir(proc_root);
	if (directory == nullptr) {
		throw_os_error(::std::string("Failed listing the process table at ") + proc_root);
	}
	while (auto entry = ::readdir(directory)) {
		const char* name = entry->d_name;
		if (*name == '\0' or ::std::strspn(name, "0123456789") != ::std::strlen(name)) {
			continue; // not a process directory
		}
		result.push_back(static_cast<id_t>(::std::stol(name)));
	}
	::closedir(directory);
	::std::sort(result.begin(), result.end());
	return result;
}

/**
 * @brief An owning wrapper for a file descriptor, closing it on destruction
 */
class unique_fd {
public:
	unique_fd() noexcept = default;
	explicit unique_fd(int fd) noexcept : fd_(fd) { }
	unique_fd(const unique_fd&) = delete;
	unique_fd(unique_fd&& other) noexcept : fd_(other.release()) { }
	~unique_fd() { reset(); }

	unique_fd& operator=(const unique_fd&) = delete;
	unique_fd& operator=(unique_fd&& other) noexcept
	{
		reset(other.release());
		return *this;
	}

	int get() const noexcept { return fd_; }
	bool is_open() const noexcept { return fd_ >= 0; }

	int release() noexcept
	{
		auto fd = fd_;
		fd_ = -1;
		return fd;
	}

	void reset(int fd = -1) noexcept
	{
		if (fd_ >= 0) { ::close(fd_); }
		fd_ = fd;
	}

protected:
	int fd_ { -1 };
};

struct pipe_t {
	unique_fd read_end;
	unique_fd write_end;
};

/// @note both ends are close-on-exec; the child's end gets `dup2()`'ed onto a standard stream
inline pipe_t make_pipe()
{
	int fds[2];
	if (::pipe2(fds, O_CLOEXEC) != 0) {
		throw_os_error("Failed creating a pipe");
	}
	return { unique_fd{fds[0]}, unique_fd{fds[1]} };
}

/// Reads whatever is available on a descriptor; @return false on end-of-file or error
inline bool read_available(int fd, ::std::string& destination)
{
	char buffer[4096];
	ssize_t num_read;
	do {
		num_read = ::read(fd, buffer, sizeof(buffer));
	} while (num_read < 0 and errno == EINTR);
	if (num_read <= 0) { return false; }
	destination.append(buffer, static_cast<::std::size_t>(num_read));
	return true;
}

/**
 * @brief Writes an entire buffer to a pipe, failing - rather than having the
 * calling process killed by `SIGPIPE` - if the reader has gone away.
 *
 * @note SIGPIPE is blocked for the calling thread only, for the duration of
 * the write; a SIGPIPE the write itself triggered is consumed before it is
 * unblocked again.
 */
inline void write_all(int fd, const ::std::string& data, const ::std::string& description)
{
	sigset_t sigpipe_only, previous_mask;
	sigemptyset(&sigpipe_only);
	sigaddset(&sigpipe_only, SIGPIPE);
	sigset_t pending;
	sigpending(&pending);
	bool sigpipe_was_pending = sigismember(&pending, SIGPIPE);
	pthread_sigmask(SIG_BLOCK, &sigpipe_only, &previous_mask);

	::std::size_t written = 0;
	int write_errno = 0;
	while (written < data.size()) {
		auto result = ::write(fd, data.data() + written, data.size() - written);
		if (result < 0) {
			if (errno == EINTR) { continue; }
			write_errno = errno;
			break;
		}
		written += static_cast<::std::size_t>(result);
	}

	if (write_errno == EPIPE and not sigpipe_was_pending) {
		static const struct timespec no_wait { 0, 0 };
		while (sigtimedwait(&sigpipe_only, nullptr, &no_wait) < 0 and errno == EINTR) { }
	}
	pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);

	if (write_errno != 0) {
		errno = write_errno;
		throw_os_error("Failed writing to " + description);
	}
}

inline ::std::vector<char*> as_null_terminated_array(::std::vector<::std::string>& strings)
{
	::std::vector<char*> result;
	result.reserve(strings.size() + 1);
	for(auto& str : strings) { result.push_back(&str[0]); }
	result.push_back(nullptr);
	return result;
}

} // namespace detail_

/**
 * @brief Determines whether a process is currently running with exactly
 * the specified command line, as the specified user.
 */
inline bool matches(id_t pid, const ::std::string& command_line, user_id_t user)
{
	auto process_owner = detail_::owner(pid);
	return process_owner and *process_owner == user
		and detail_::read_command_line(pid) == command_line;
}

/**
 * @brief Finds all processes of a given user having exactly the specified command line.
 *
 * @note Equivalent to `pgrep -u <user> -fx <command_line>`
 *
 * @return the matching processes' ids, in increasing order; empty if there are none
 */
inline ::std::vector<id_t> find(const ::std::string& command_line, user_id_t user)
{
	auto candidates = detail_::all();
	::std::vector<id_t> result;
	::std::copy_if(candidates.cbegin(), candidates.cend(), ::std::back_inserter(result),
		[&](id_t pid) { return matches(pid, command_line, user); });
	return result;
}

/**
 * @brief Obtains the value of one of a process' environment variables.
 *
 * @return the variable's value; an empty string if it is unset, or if the process'
 * environment could not be read.
 */
inline ::std::string environment_variable(id_t pid, const ::std::string& variable_name)
{
	return environment::get(detail_::read_environment(pid), variable_name);
}

inline bool exited_successfully(exit_status_t status)
{
	return WIFEXITED(status) and WEXITSTATUS(status) == EXIT_SUCCESS;
}

/// A human-readable account of how a process terminated
inline ::std::string describe_exit(exit_status_t status)
{
	if (WIFEXITED(status)) { return "exited with status " + ::std::to_string(WEXITSTATUS(status)); }
	if (WIFSIGNALED(status)) { return "was killed by signal " + ::std::to_string(WTERMSIG(status)); }
	return "terminated abnormally (wait status " + ::std::to_string(status) + ")";
}

/// Which of a child's standard streams are connected to pipes, rather than inherited
struct launch_options_t {
	bool pipe_input { false };
	bool capture_output { false };
};

/// What a child wrote to its standard output and error streams
struct output_t {
	::std::string standard_output;
	::std::string standard_error;
	/// true if both streams reached end-of-file, i.e. the child (and any
	/// process inheriting its streams) has closed them
	bool complete;

	bool contains(const ::std::string& text) const
	{
		return standard_output.find(text) != ::std::string::npos
			or standard_error.find(text) != ::std::string::npos;
	}
};

class child_t;

/**
 * @brief Launches a program as a child process.
 *
 * @param command_line the program - searched for on the `PATH` unless it contains
 * a slash - followed by its arguments
 * @param environment_overlay variables to set for the child, on top of the
 * current process' environment (which is itself left unchanged)
 *
 * @throws cudamps::runtime_error with @ref status::launch_failure if the program
 * could not be executed at all (e.g. it does not exist, or is not executable)
 */
inline child_t launch(
	const command_line_t&  command_line,
	const environment_t&   environment_overlay,
	launch_options_t       options = {});

/**
 * @brief A child process launched by the supervisor, with the parent's ends of
 * whichever of its standard streams were piped.
 *
 * @note Destroying an un-waited-for child does not kill it; if it has already
 * exited, it is reaped, otherwise it is left to run on (detached).
 */
class child_t {
public:
	id_t id() const noexcept { return id_; }

	/**
	 * Writes to the child's standard input
	 *
	 * @throws cudamps::runtime_error if the input is not piped, or the child has closed it
	 */
	void write_input(const ::std::string& data)
	{
		if (not input_.is_open()) {
			throw runtime_error(status::operating_system,
				"Standard input of " + detail_::identify(id_) + " is not connected to a pipe");
		}
		detail_::write_all(input_.get(), data, "the standard input of " + detail_::identify(id_));
	}

	/// Signals end-of-file on the child's standard input
	void close_input() noexcept { input_.reset(); }

	/**
	 * @brief Collects the child's output until both its output streams are closed,
	 * or until a timeout elapses - whichever happens first.
	 */
	output_t collect_output(duration_t timeout)
	{
		output_t result { {}, {}, false };
		auto deadline = ::std::chrono::steady_clock::now() + timeout;
		while (output_.is_open() or error_.is_open()) {
			auto remaining = ::std::chrono::duration_cast<duration_t>(deadline - ::std::chrono::steady_clock::now());
			if (remaining.count() <= 0) { return result; }
			struct pollfd fds[2] = {
				{ output_.get(), POLLIN, 0 },
				{ error_.get(),  POLLIN, 0 },
			};
			// poll() ignores entries with negative descriptors, i.e. closed streams
			auto num_ready = ::poll(fds, 2, static_cast<int>(remaining.count()));
			if (num_ready < 0) {
				if (errno == EINTR) { continue; }
				throw_os_error("Failed polling the output streams of " + detail_::identify(id_));
			}
			if (num_ready == 0) { return result; }
			if (fds[0].revents != 0 and not detail_::read_available(output_.get(), result.standard_output)) {
				output_.reset();
			}
			if (fds[1].revents != 0 and not detail_::read_available(error_.get(), result.standard_error)) {
				error_.reset();
			}
		}
		result.complete = true;
		return result;
	}

	/**
	 * @brief Blocks until the child exits
	 *
	 * @return its wait status, to be interpreted with @ref exited_successfully or @ref describe_exit
	 */
	exit_status_t wait()
	{
		if (reaped_) { return exit_status_; }
		input_.reset();
		pid_t result;
		do {
			result = ::waitpid(id_, &exit_status_, 0);
		} while (result < 0 and errno == EINTR);
		if (result < 0) {
			throw_os_error("Failed waiting for " + detail_::identify(id_) + " to exit");
		}
		reaped_ = true;
		return exit_status_;
	}

	/**
	 * @return the child's wait status if it has already exited; nothing if it is still running
	 */
	optional<exit_status_t> try_wait()
	{
		if (reaped_) { return exit_status_; }
		auto result = ::waitpid(id_, &exit_status_, WNOHANG);
		if (result == id_) {
			reaped_ = true;
			return exit_status_;
		}
		return nullopt;
	}

	child_t(const child_t&) = delete;
	child_t(child_t&& other) noexcept :
		id_(other.id_), input_(::std::move(other.input_)), output_(::std::move(other.output_)),
		error_(::std::move(other.error_)), reaped_(other.reaped_), exit_status_(other.exit_status_)
	{
		other.reaped_ = true;
	}
	~child_t()
	{
		if (not reaped_) { try_wait(); }
	}

protected:
	child_t(id_t id, detail_::unique_fd input, detail_::unique_fd output, detail_::unique_fd error) noexcept :
		id_(id), input_(::std::move(input)), output_(::std::move(output)), error_(::std::move(error))
	{ }

	friend child_t launch(const command_line_t&, const environment_t&, launch_options_t);

	id_t id_;
	detail_::unique_fd input_;
	detail_::unique_fd output_;
	detail_::unique_fd error_;
	bool reaped_ { false };
	exit_status_t exit_status_ { 0 };
};

inline child_t launch(
	const command_line_t&  command_line,
	const environment_t&   environment_overlay,
	launch_options_t       options)
{
	if (command_line.empty()) {
		throw ::std::invalid_argument("Cannot launch an empty command line");
	}
	// Everything the child needs is prepared before forking, as the child
	// of a possibly-multithreaded parent may not allocate memory
	auto arguments = command_line;
	auto argv = detail_::as_null_terminated_array(arguments);
	auto environment_entries = environment::merge(environment_overlay);
	auto envp = detail_::as_null_terminated_array(environment_entries);

	detail_::pipe_t input, output, error;
	if (options.pipe_input) { input = detail_::make_pipe(); }
	if (options.capture_output) {
		output = detail_::make_pipe();
		error = detail_::make_pipe();
	}
	// Written to only if exec fails; closed by a successful exec
	auto exec_failure = detail_::make_pipe();

	auto pid = ::fork();
	if (pid < 0) {
		throw_os_error("Failed forking a process for launching " + command_line.front());
	}
	if (pid == 0) {
		if (options.pipe_input) { ::dup2(input.read_end.get(), STDIN_FILENO); }
		if (options.capture_output) {
			::dup2(output.write_end.get(), STDOUT_FILENO);
			::dup2(error.write_end.get(), STDERR_FILENO);
		}
		::execvpe(argv[0], argv.data(), envp.data());
		int exec_errno = errno;
		CUDAMPS_MAYBE_UNUSED auto ignored = ::write(exec_failure.write_end.get(), &exec_errno, sizeof(exec_errno));
		::_exit(127);
	}

	exec_failure.write_end.reset();
	input.read_end.reset();
	output.write_end.reset();
	error.write_end.reset();

	int exec_errno;
	ssize_t num_read;
	do {
		num_read = ::read(exec_failure.read_end.get(), &exec_errno, sizeof(exec_errno));
	} while (num_read < 0 and errno == EINTR);
	if (num_read == sizeof(exec_errno)) {
		int ignored_status;
		while (::waitpid(pid, &ignored_status, 0) < 0 and errno == EINTR) { }
		throw runtime_error(status::launch_failure,
			"Failed executing " + command_line.front() + " (" + ::std::strerror(exec_errno) + ")");
	}
	return child_t { pid, ::std::move(input.write_end), ::std::move(output.read_end), ::std::move(error.read_end) };
}

} // namespace process

} // namespace cudamps

#endif // CUDAMPS_PROCESS_HPP_
