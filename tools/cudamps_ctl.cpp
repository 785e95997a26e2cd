/**
 * @file
 *
 * @brief A command-line front-end for the MPS daemon supervisor: lists the
 * devices MPS can serve, and starts, stops and inspects the current user's
 * control daemons.
 *
 * Usage: cudamps-ctl [options] <command> [command options]
 *
 * Exit status: 0 on success, 1 if the operation failed, 2 on a usage error.
 */

#include <cudamps/api.hpp>
#include <cudamps/nvml.hpp>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include <sys/wait.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr const int usage_error { 2 };
constexpr const int operation_failed { 1 };

struct usage_error_t : ::std::runtime_error {
	using ::std::runtime_error::runtime_error;
};

template <typename T>
T required(const po::variables_map& options, const char* name, const ::std::string& command)
{
	if (options.count(name) == 0) {
		throw usage_error_t("The " + command + " command requires --" + name);
	}
	return options[name].as<T>();
}

int list_devices(const cudamps::supervisor_t& supervisor)
{
	const auto& supported = supervisor.supported_devices();
	auto num_devices = cudamps::device::count();
	for(cudamps::device::id_t id = 0; id < num_devices; id++) {
		auto properties = cudamps::device::properties(id);
		bool is_supported = ::std::find(supported.cbegin(), supported.cend(), id) != supported.cend();
		::std::cout
			<< id << '\t' << properties.name
			<< "\tcompute capability " << properties.compute_capability.as_string()
			<< '\t' << cudamps::device::name(properties.compute_mode)
			<< '\t' << (is_supported ? "supported" : "unsupported") << '\n';
		if (is_supported and properties.compute_mode != cudamps::device::compute_mode_t::exclusive_process) {
			cudamps::log::logger()->warn("{} is in the {} compute mode; MPS is normally run in exclusive-process mode",
				cudamps::device::detail_::identify(id), cudamps::device::name(properties.compute_mode));
		}
	}
	return EXIT_SUCCESS;
}

int list_daemons(const cudamps::supervisor_t& supervisor)
{
	for(auto pid : supervisor.list_running()) {
		auto visible_devices = supervisor.get_visible_devices(pid);
		::std::cout << pid << '\t';
		if (visible_devices.empty()) { ::std::cout << '-'; }
		else { ::std::cout << visible_devices.front(); }
		::std::cout << '\t' << supervisor.get_pipe_directory(pid) << '\n';
	}
	return EXIT_SUCCESS;
}

int start(cudamps::supervisor_t& supervisor, const po::variables_map& options)
{
	if (options["all"].as<bool>()) {
		for(const auto& directory : supervisor.start_all()) {
			::std::cout << directory << '\n';
		}
		return EXIT_SUCCESS;
	}
	auto device_id = required<int>(options, "device", "start");
	auto directory = (options.count("directory") > 0) ?
		supervisor.start(device_id, options["directory"].as<::std::string>()) :
		supervisor.start(device_id);
	::std::cout << directory << '\n';
	return EXIT_SUCCESS;
}

int stop(cudamps::supervisor_t& supervisor, const po::variables_map& options)
{
	auto clean = options["clean"].as<bool>();
	if (options["all"].as<bool>()) {
		supervisor.stop_all(clean);
	}
	else {
		supervisor.stop(required<int>(options, "pid", "stop"), clean);
	}
	return EXIT_SUCCESS;
}

int list_clients(const po::variables_map& options)
{
	auto device_id = required<int>(options, "device", "clients");
	cudamps::nvml::session_t nvml_session;
	for(auto pid : cudamps::nvml::device::mps_client_processes(device_id)) {
		::std::cout << pid << '\n';
	}
	return EXIT_SUCCESS;
}

::std::string directory_of_device(const cudamps::supervisor_t& supervisor, cudamps::device::id_t device_id)
{
	auto directory = supervisor.find_directory_by_device(device_id);
	if (directory.empty()) {
		throw cudamps::runtime_error(cudamps::status::no_such_daemon,
			"No daemon is serving " + cudamps::device::detail_::identify(device_id));
	}
	return directory;
}

int run_client(const cudamps::supervisor_t& supervisor, const po::variables_map& options)
{
	auto device_id = required<int>(options, "device", "run");
	if (options.count("arguments") == 0) {
		throw usage_error_t("The run command requires a command line to run, after --");
	}
	auto command_line = options["arguments"].as<cudamps::command_line_t>();
	auto exit_status = supervisor.run_client(directory_of_device(supervisor, device_id), command_line);
	if (not WIFEXITED(exit_status)) {
		cudamps::log::logger()->error("{} {}", command_line.front(), cudamps::process::describe_exit(exit_status));
		return operation_failed;
	}
	return WEXITSTATUS(exit_status);
}

int print_server_log(const cudamps::supervisor_t& supervisor, const po::variables_map& options)
{
	auto pid = required<int>(options, "pid", "log");
	auto directory = supervisor.get_pipe_directory(pid);
	if (directory.empty()) {
		throw cudamps::runtime_error(cudamps::status::no_such_daemon,
			"No MPS pipe directory found for " + cudamps::process::detail_::identify(pid));
	}
	::std::cout << supervisor.server_log(directory);
	return EXIT_SUCCESS;
}

cudamps::configuration_t make_configuration(const po::variables_map& options)
{
	auto configuration = cudamps::configuration_t::from_environment();
	if (options.count("control-program") > 0) {
		configuration.control_program = options["control-program"].as<::std::string>();
	}
	if (options.count("launch-timeout-ms") > 0) {
		auto timeout = options["launch-timeout-ms"].as<long>();
		if (timeout < 0) { throw usage_error_t("The launch timeout must be non-negative"); }
		configuration.launch_timeout = cudamps::duration_t{ timeout };
	}
	return configuration;
}

} // namespace

int main(int argc, char** argv)
{
	po::options_description general("General options");
	general.add_options()
		("help,h", "Print this message")
		("control-program", po::value<::std::string>(), "The MPS control program to use")
		("launch-timeout-ms", po::value<long>(), "How long to wait for a starting daemon to report failure")
		("log-level", po::value<::std::string>(), "trace, debug, info, warn, error, critical or off (default: $SPDLOG_LEVEL)");
	po::options_description command_options("Command options");
	command_options.add_options()
		("device,d", po::value<int>(), "CUDA device id")
		("pid,p", po::value<int>(), "Process id of a daemon")
		("directory", po::value<::std::string>(), "Pipe/log directory for a new daemon")
		("all", po::bool_switch()->default_value(false), "Act on all supported devices, or all running daemons")
		("clean", po::bool_switch()->default_value(false), "Remove the pipe/log directory of stopped daemons");
	po::options_description hidden;
	hidden.add_options()
		("command", po::value<::std::string>(), "")
		("arguments", po::value<cudamps::command_line_t>(), "");
	po::options_description all_options;
	all_options.add(general).add(command_options).add(hidden);
	po::positional_options_description positional;
	positional.add("command", 1).add("arguments", -1);

	auto print_usage = [&](::std::ostream& os) {
		os << "Usage: " << argv[0] << " [options] <command> [command options]\n\n"
			<< "Commands:\n"
			<< "  devices                                 List CUDA devices and whether MPS supports them\n"
			<< "  list                                    List running daemons: pid, device, directory\n"
			<< "  start (--device N [--directory D]|--all) Start daemons; prints their directories\n"
			<< "  stop (--pid P|--all) [--clean]          Stop daemons\n"
			<< "  clients --device N                      List the MPS client processes on a device\n"
			<< "  run --device N -- <command...>          Run a command as a client of a device's daemon\n"
			<< "  log --pid P                             Print a daemon's MPS server log\n\n"
			<< general << '\n' << command_options << '\n';
	};

	po::variables_map options;
	try {
		po::store(po::command_line_parser(argc, argv).options(all_options).positional(positional).run(), options);
		po::notify(options);
	}
	catch (const po::error& ex) {
		::std::cerr << ex.what() << "\n\n";
		print_usage(::std::cerr);
		return usage_error;
	}
	if (options.count("help") > 0) {
		print_usage(::std::cout);
		return EXIT_SUCCESS;
	}
	if (options.count("command") == 0) {
		print_usage(::std::cerr);
		return usage_error;
	}

	auto logger = cudamps::log::logger();
	spdlog::cfg::load_env_levels();
	if (options.count("log-level") > 0) {
		auto level_name = options["log-level"].as<::std::string>();
		// from_str() maps any name it does not recognize to "off"
		auto level = spdlog::level::from_str(level_name);
		if (level == spdlog::level::off and level_name != "off") {
			::std::cerr << "Invalid log level " << level_name << "\n\n";
			print_usage(::std::cerr);
			return usage_error;
		}
		spdlog::set_level(level);
	}

	auto command = options["command"].as<::std::string>();
	try {
		if (command != "run" and options.count("arguments") > 0) {
			throw usage_error_t("Unexpected arguments for the " + command + " command");
		}
		cudamps::supervisor_t supervisor { make_configuration(options) };
		if (command == "devices") { return list_devices(supervisor); }
		if (command == "list")    { return list_daemons(supervisor); }
		if (command == "start")   { return start(supervisor, options); }
		if (command == "stop")    { return stop(supervisor, options); }
		if (command == "clients") { return list_clients(options); }
		if (command == "run")     { return run_client(supervisor, options); }
		if (command == "log")     { return print_server_log(supervisor, options); }
		throw usage_error_t("Unknown command " + command);
	}
	catch (const usage_error_t& ex) {
		::std::cerr << ex.what() << "\n\n";
		print_usage(::std::cerr);
		return usage_error;
	}
	catch (const ::std::runtime_error& ex) {
		// All of cudamps::runtime_error, cudamps::driver::runtime_error and cudamps::nvml::runtime_error
		logger->error("{}", ex.what());
		return operation_failed;
	}
}
