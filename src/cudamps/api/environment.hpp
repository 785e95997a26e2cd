/**
 * @file
 *
 * @brief Parsing of process environment blocks, and construction of the
 * environments with which child processes are launched.
 *
 * The kernel exposes the initial environment of a process as a block of
 * NUL-terminated `NAME=value` entries. The supervisor reads a daemon's
 * configuration out of such blocks, and configures the daemons it launches
 * by overlaying a few assignments on its own inherited environment - without
 * ever modifying the latter.
 */
#pragma once
#ifndef CUDAMPS_ENVIRONMENT_HPP_
#define CUDAMPS_ENVIRONMENT_HPP_

#include "types.hpp"
#include "constants.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

extern char** environ;

namespace cudamps {

namespace environment {

/**
 * @brief Obtains the value of a variable within a raw environment block
 *
 * @param block NUL-separated (or newline-separated) `NAME=value` entries
 * @param variable_name the exact name of the variable to look up
 * @return the value of the first assignment to the variable; an empty string
 * if there is no such assignment
 */
inline ::std::string get(const ::std::string& block, const ::std::string& variable_name)
{
	auto as_lines = block;
	::std::replace(as_lines.begin(), as_lines.end(), '\0', '\n');

	static const ::std::regex special_characters { R"([.^$|()\[\]{}*+?\\])" };
	::std::regex assignment {
		// '.' would not match a carriage return within the value
		::std::regex_replace(variable_name, special_characters, R"(\$&)") + R"(=([^\n]*))"
	};

	::std::istringstream lines { as_lines };
	::std::string line;
	::std::smatch match;
	while (::std::getline(lines, line)) {
		if (::std::regex_match(line, match, assignment)) {
			return match[1].str();
		}
	}
	return {};
}

/**
 * @brief Parses a list of device indices, as it appears in `CUDA_VISIBLE_DEVICES`
 *
 * @note Parsing stops at the first entry which is not an integer, or is out of
 * range, just like the CUDA driver ignores everything from the first invalid
 * entry onwards; a
 * `CUDA_VISIBLE_DEVICES` holding device UUIDs therefore yields an empty list.
 */
inline ::std::vector<device::id_t> parse_device_list(const ::std::string& list)
{
	::std::vector<device::id_t> result;
	if (list.empty()) { return result; }
	::std::istringstream entries { list };
	::std::string entry;
	while (::std::getline(entries, entry, variables::visible_devices_separator)) {
		char* end;
		errno = 0;
		auto value = ::std::strtol(entry.c_str(), &end, 10);
		if (entry.empty() or *end != '\0' or errno == ERANGE
			or value > ::std::numeric_limits<device::id_t>::max()
			or value < ::std::numeric_limits<device::id_t>::min()) { break; }
		result.push_back(static_cast<device::id_t>(value));
	}
	return result;
}

/**
 * @brief Produces the environment of a child process
 *
 * @param base the parent's environment, as a null-terminated array of `NAME=value` strings
 * @param overlay assignments which replace, or are added to, those in @p base
 * @return `NAME=value` entries, each variable appearing once
 */
inline ::std::vector<::std::string> merge(char const* const* base, const environment_t& overlay)
{
	::std::vector<::std::string> result;
	for(auto entry = base; entry != nullptr and *entry != nullptr; entry++) {
		::std::string assignment { *entry };
		auto name = assignment.substr(0, assignment.find('='));
		if (overlay.find(name) == overlay.end()) {
			result.push_back(::std::move(assignment));
		}
	}
	for(const auto& variable : overlay) {
		result.push_back(variable.first + '=' + variable.second);
	}
	return result;
}

/// @copydoc merge(char const* const*, const environment_t&)
///
/// @note uses the current process' environment as the base
inline ::std::vector<::std::string> merge(const environment_t& overlay)
{
	return merge(environ, overlay);
}

} // namespace environment

} // namespace cudamps

#endif // CUDAMPS_ENVIRONMENT_HPP_
