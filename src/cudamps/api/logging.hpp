/**
 * @file
 *
 * @brief Access to the logger through which the library reports what it does
 * with daemon processes.
 *
 * @note The library never configures logging sinks or levels on its own,
 * beyond creating a default stderr logger if the application has not
 * registered one named @ref cudamps::log::logger_name .
 */
#pragma once
#ifndef CUDAMPS_LOGGING_HPP_
#define CUDAMPS_LOGGING_HPP_

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace cudamps {

namespace log {

constexpr const char* logger_name { "cudamps" };

/**
 * @return the library's logger; an application wishing to direct the library's
 * log messages elsewhere should register its own logger under @ref logger_name
 * before using the library.
 */
inline ::std::shared_ptr<spdlog::logger> logger()
{
	auto existing = spdlog::get(logger_name);
	if (existing) { return existing; }
	try {
		return spdlog::stderr_color_mt(logger_name);
	}
	catch (const spdlog::spdlog_ex&) {
		// Another thread registered it in the meantime
		return spdlog::get(logger_name);
	}
}

} // namespace log

} // namespace cudamps

#endif // CUDAMPS_LOGGING_HPP_
