/**
 * @file
 *
 * @brief The @ref cudamps::supervisor_t class, which discovers, starts and stops
 * MPS control daemons.
 *
 * @note The supervisor keeps no record of the daemons it has started: all it
 * knows about them it re-derives from the process table on every call, so that
 * it stays consistent with daemons started or stopped by other means - other
 * supervisors, or the control program invoked by hand.
 */
#pragma once
#ifndef CUDAMPS_SUPERVISOR_HPP_
#define CUDAMPS_SUPERVISOR_HPP_

#include "types.hpp"
#include "constants.hpp"
#include "error.hpp"
#include "configuration.hpp"
#include "logging.hpp"
#include "environment.hpp"
#include "filesystem.hpp"
#include "process.hpp"
#include "device.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cudamps {

/**
 * @brief Produces the ids of the devices a supervisor may start daemons for,
 * in increasing order.
 */
using device_enumerator_t = ::std::function<::std::vector<device::id_t>()>;

namespace detail_ {

inline device_enumerator_t default_device_enumerator(const configuration_t& configuration)
{
	auto name_pattern = configuration.device_name_pattern;
	auto minimum_compute_capability = configuration.minimum_compute_capability;
	return [name_pattern, minimum_compute_capability]() {
		return device::supported(name_pattern, minimum_compute_capability);
	};
}

} // namespace detail_

/**
 * @brief Manages the MPS control daemons of the current user, each serving
 * a single device and using its own pipe/log directory.
 *
 * A daemon is recognized by its command line (the control program followed by
 * the daemon flag, and nothing else), and is associated with a device and a
 * directory through the `CUDA_VISIBLE_DEVICES` and `CUDA_MPS_PIPE_DIRECTORY`
 * variables in its environment.
 *
 * @note Not copyable or movable; the only state is the (lazily-computed) list
 * of supported devices, which never changes once computed.
 */
class supervisor_t {
public:
	/**
	 * Lists the daemons running as the current user
	 *
	 * @return their process ids, in increasing order; empty if there are none
	 */
	::std::vector<process::id_t> list_running() const
	{
		auto result = process::find(configuration_.daemon_command_line(), ::geteuid());
		log::logger()->debug("Found {} running instance(s) of \"{}\"", result.size(), configuration_.daemon_command_line());
		return result;
	}

	/// @return true if @p pid is one of the current user's running daemons
	bool is_running(process::id_t pid) const
	{
		return process::matches(pid, configuration_.daemon_command_line(), ::geteuid());
	}

	/**
	 * @return the pipe directory of the daemon process @p pid; an empty string if it
	 * has none, or if its environment cannot be read (e.g. since it no longer exists)
	 */
	::std::string get_pipe_directory(process::id_t pid) const
	{
		auto directory = process::environment_variable(pid, environment::variables::pipe_directory);
		log::logger()->debug("Pipe directory of {}: \"{}\"", process::detail_::identify(pid), directory);
		return directory;
	}

	/**
	 * @return the devices visible to the daemon process @p pid, in the order the
	 * daemon sees them; empty if it has no (integral) `CUDA_VISIBLE_DEVICES` setting,
	 * or if its environment cannot be read.
	 */
	::std::vector<device::id_t> get_visible_devices(process::id_t pid) const
	{
		return environment::parse_device_list(
			process::environment_variable(pid, environment::variables::visible_devices));
	}

	/**
	 * @brief Finds the daemon serving a device
	 *
	 * A daemon started by this class sees its device as the device's index among the
	 * @ref supported_devices ; a daemon started otherwise typically sees it by its
	 * actual id. The first kind is looked for first.
	 *
	 * @note May enumerate the supported devices, if that hasn't happened yet.
	 *
	 * @return the process id of the first running daemon (in increasing pid order)
	 * whose first visible device is @p device_id , or its supported-device index;
	 * nothing if there's no such daemon
	 */
	optional<process::id_t> find_process_by_device(device::id_t device_id) const
	{
		auto local_index = local_index_of(device_id);
		if (local_index) {
			auto pid = find_process_seeing_first(*local_index);
			if (pid or *local_index == device_id) { return pid; }
		}
		return find_process_seeing_first(device_id);
	}

	/**
	 * @return the pipe directory of the daemon serving @p device_id ; an empty string
	 * if there's no such daemon
	 */
	::std::string find_directory_by_device(device::id_t device_id) const
	{
		auto pid = find_process_by_device(device_id);
		if (not pid) { return {}; }
		return get_pipe_directory(*pid);
	}

	/**
	 * @brief The devices for which daemons may be started, in increasing order.
	 *
	 * @note Computed on first use only.
	 */
	const ::std::vector<device::id_t>& supported_devices() const
	{
		::std::call_once(supported_devices_computed_, [this]() {
			supported_devices_ = enumerate_devices_();
			log::logger()->debug("{} device(s) support MPS", supported_devices_.size());
		});
		return supported_devices_;
	}

	/**
	 * @brief Starts a daemon for a single device, using a newly-created temporary
	 * directory for its pipes and logs.
	 *
	 * @return the daemon's pipe/log directory
	 */
	::std::string start(device::id_t device_id)
	{
		return start_(device_id, nullptr);
	}

	/**
	 * @brief Starts a daemon for a single device, using an existing directory
	 * for its pipes and logs.
	 *
	 * @throws cudamps::runtime_error with
	 * @ref status::unsupported_device if @p device_id is not one of the @ref supported_devices ;
	 * @ref status::daemon_already_running if a daemon is already serving the device,
	 * or another daemon is already using @p directory ;
	 * @ref status::launch_failure if the control program could not be executed, or
	 * reported a failure other than the above.
	 *
	 * @return @p directory
	 */
	::std::string start(device::id_t device_id, const ::std::string& directory)
	{
		return start_(device_id, &directory);
	}

	/**
	 * @brief Starts a daemon for every supported device, each with a new temporary
	 * directory, in increasing order of device id.
	 *
	 * @note Stops at the first failure, leaving the daemons already started running.
	 *
	 * @return the directories of the started daemons
	 */
	::std::vector<::std::string> start_all()
	{
		::std::vector<::std::string> directories;
		for(auto device_id : supported_devices()) {
			directories.push_back(start(device_id));
		}
		return directories;
	}

	/**
	 * @brief Has a running daemon shut down, by sending it the shutdown command
	 * through the control program.
	 *
	 * @param clean if true, the daemon's pipe/log directory is removed once the
	 * daemon has exited; it is left in place if the daemon is still running when
	 * the shutdown timeout elapses
	 *
	 * @throws cudamps::runtime_error with
	 * @ref status::no_such_daemon if @p pid has no readable pipe directory (in which
	 * case nothing is sent); @ref status::control_command_failed if the control
	 * program did not exit successfully.
	 */
	void stop(process::id_t pid, bool clean = false)
	{
		auto directory = get_pipe_directory(pid);
		if (directory.empty()) {
			throw runtime_error(status::no_such_daemon,
				"Cannot stop " + process::detail_::identify(pid) + ": No MPS pipe directory found for it");
		}
		auto logger = log::logger();
		logger->info("Stopping the daemon {} using {}", process::detail_::identify(pid), directory);

		process::launch_options_t options;
		options.pipe_input = true;
		auto control = process::launch({ configuration_.control_program }, client_environment(directory), options);
		try {
			control.write_input(configuration_.shutdown_command + '\n');
		}
		catch (const runtime_error& ex) {
			// The control program's exit status, checked below, says why it stopped reading
			logger->debug("{}", ex.what());
		}
		auto exit_status = control.wait();
		if (not process::exited_successfully(exit_status)) {
			throw runtime_error(status::control_command_failed,
				"Sending \"" + configuration_.shutdown_command + "\" to the daemon using " + directory
				+ " failed: " + configuration_.control_program + ' ' + process::describe_exit(exit_status));
		}

		if (not await_exit(pid)) {
			logger->warn("{} is still running {} ms after being told to shut down{}",
				process::detail_::identify(pid), configuration_.shutdown_timeout.count(),
				clean ? "; not removing " + directory : ::std::string{});
			return;
		}
		if (clean) {
			logger->debug("Removing {}", directory);
			filesystem::remove_tree(directory);
		}
	}

	/**
	 * @brief Stops every daemon the current user is running.
	 *
	 * @note Stops at the first failure, leaving the remaining daemons running.
	 */
	void stop_all(bool clean = false)
	{
		for(auto pid : list_running()) {
			stop(pid, clean);
		}
	}

	/// @return the overlay with which a CUDA process becomes a client of the daemon using @p directory
	environment_t client_environment(const ::std::string& directory) const
	{
		return { { environment::variables::pipe_directory, directory } };
	}

	/**
	 * @brief Runs a program as a client of the daemon using @p directory , waiting
	 * for it to finish.
	 *
	 * @return the program's wait status
	 */
	process::exit_status_t run_client(const ::std::string& directory, const command_line_t& command_line) const
	{
		log::logger()->info("Running {} as a client of the daemon using {}", command_line.front(), directory);
		auto client = process::launch(command_line, client_environment(directory));
		return client.wait();
	}

	/// @return the MPS server's log in @p directory ; empty if there is none (yet)
	::std::string server_log(const ::std::string& directory) const
	{
		return filesystem::read(filesystem::join(directory, daemon::server_log_file_name));
	}

	const configuration_t& configuration() const noexcept { return configuration_; }

protected:
	::std::string start_(device::id_t device_id, const ::std::string* provided_directory)
	{
		auto local_index = local_index_of(device_id);
		if (not local_index) {
			throw runtime_error(status::unsupported_device,
				"Cannot start a daemon for " + device::detail_::identify(device_id));
		}

		auto existing = find_process_by_device(device_id);
		if (existing) {
			throw runtime_error(status::daemon_already_running,
				"Cannot start a daemon for " + device::detail_::identify(device_id) + ": "
				+ process::detail_::identify(*existing) + " is already serving it");
		}

		auto directory = (provided_directory != nullptr) ?
			*provided_directory : filesystem::make_temporary_directory(daemon::temporary_directory_prefix);
		environment_t overlay {
			{ environment::variables::visible_devices, ::std::to_string(*local_index) },
			{ environment::variables::pipe_directory,  directory },
			{ environment::variables::log_directory,   directory },
		};
		auto logger = log::logger();
		logger->info("Starting a daemon for {} using {}", device::detail_::identify(device_id), directory);

		process::launch_options_t options;
		options.capture_output = true;
		auto launcher = process::launch({ configuration_.control_program, configuration_.daemon_flag }, overlay, options);
		auto output = launcher.collect_output(configuration_.launch_timeout);
		if (output.contains(configuration_.already_running_message)) {
			throw runtime_error(status::daemon_already_running,
				"A running daemon is already using " + directory);
		}
		if (not output.complete) {
			// The daemon gives no sign of readiness; silence means it has detached and is running
			logger->debug("No output from {} within {} ms", process::detail_::identify(launcher.id()),
				configuration_.launch_timeout.count());
			return directory;
		}
		auto exit_status = launcher.wait();
		if (not process::exited_successfully(exit_status)) {
			throw runtime_error(status::launch_failure,
				"Failed starting a daemon for " + device::detail_::identify(device_id) + ": "
				+ configuration_.control_program + ' ' + process::describe_exit(exit_status)
				+ (output.standard_error.empty() ? "" : ": " + output.standard_error));
		}
		return directory;
	}

	/// @return the position of @p device_id among the supported devices, if it is one of them
	optional<device::id_t> local_index_of(device::id_t device_id) const
	{
		const auto& supported = supported_devices();
		auto found = ::std::find(supported.cbegin(), supported.cend(), device_id);
		if (found == supported.cend()) { return nullopt; }
		return static_cast<device::id_t>(::std::distance(supported.cbegin(), found));
	}

	optional<process::id_t> find_process_seeing_first(device::id_t visible_device) const
	{
		for(auto pid : list_running()) {
			auto visible_devices = get_visible_devices(pid);
			if (not visible_devices.empty() and visible_devices.front() == visible_device) {
				return pid;
			}
		}
		return nullopt;
	}

	/// @return true if the daemon exited within the shutdown timeout
	bool await_exit(process::id_t pid) const
	{
		static constexpr const duration_t polling_interval { 10 };
		auto deadline = ::std::chrono::steady_clock::now() + configuration_.shutdown_timeout;
		while (is_running(pid)) {
			if (::std::chrono::steady_clock::now() >= deadline) { return false; }
			::std::this_thread::sleep_for(polling_interval);
		}
		return true;
	}

public:
	explicit supervisor_t(configuration_t configuration = configuration_t::from_environment()) :
		configuration_(::std::move(configuration)),
		enumerate_devices_(detail_::default_device_enumerator(configuration_))
	{ }

	/**
	 * @param enumerate_devices used in place of querying the CUDA driver for the
	 * supported devices
	 */
	supervisor_t(configuration_t configuration, device_enumerator_t enumerate_devices) :
		configuration_(::std::move(configuration)),
		enumerate_devices_(::std::move(enumerate_devices))
	{ }

	supervisor_t(const supervisor_t&) = delete;
	supervisor_t& operator=(const supervisor_t&) = delete;

protected:
	configuration_t configuration_;
	device_enumerator_t enumerate_devices_;
	mutable ::std::once_flag supported_devices_computed_;
	mutable ::std::vector<device::id_t> supported_devices_;
};

} // namespace cudamps

#endif // CUDAMPS_SUPERVISOR_HPP_
