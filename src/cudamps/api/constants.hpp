/**
 * @file constants.hpp
 *
 * @brief Fixed names used when interacting with MPS control daemons: the
 * control program, the environment variables through which a daemon is
 * configured, and the files it keeps in its pipe directory.
 *
 */
#pragma once
#ifndef CUDAMPS_CONSTANTS_HPP_
#define CUDAMPS_CONSTANTS_HPP_

#include "types.hpp"

namespace cudamps {

namespace control_program {

/// The MPS control program as shipped with the CUDA driver
constexpr const char* default_name { "nvidia-cuda-mps-control" };

/// Makes the control program fork off a background control daemon
constexpr const char* daemon_flag { "-d" };

/// Control command which makes the daemon (and its servers) exit
constexpr const char* shutdown_command { "quit" };

/**
 * What the control program prints when asked to start a daemon on a pipe
 * directory another daemon already uses.
 */
constexpr const char* already_running_message { "An instance of this daemon is already running" };

} // namespace control_program

namespace environment {

namespace variables {

/// Restricts the set (and the order) of devices a CUDA process sees
constexpr const char* visible_devices { "CUDA_VISIBLE_DEVICES" };

/// The directory holding a daemon's control pipes; clients locate their daemon through it
constexpr const char* pipe_directory { "CUDA_MPS_PIPE_DIRECTORY" };

/// The directory to which a daemon and its servers write their logs
constexpr const char* log_directory { "CUDA_MPS_LOG_DIRECTORY" };

/// Separates the entries of the visible devices list
constexpr const char visible_devices_separator { ',' };

} // namespace variables

} // namespace environment

namespace daemon {

/// The log file of the MPS server, within a daemon's log directory
constexpr const char* server_log_file_name { "server.log" };

/// The log file of the control daemon itself, within its log directory
constexpr const char* control_log_file_name { "control.log" };

/// Prefix of the temporary directories created for daemons lacking a caller-provided one
constexpr const char* temporary_directory_prefix { "cudamps-" };

} // namespace daemon

} // namespace cudamps

#endif // CUDAMPS_CONSTANTS_HPP_
