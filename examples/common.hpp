/**
 * @file
 *
 * @brief Common header for the MPS supervisor example programs.
 *
 * @note Each example program checks what it exercises, exiting with a failure
 * status - and a message on the standard error stream - on the first
 * discrepancy; and prints "SUCCESS" otherwise.
 */
#ifndef EXAMPLES_COMMON_HPP_
#define EXAMPLES_COMMON_HPP_

#include <cudamps/api.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

/// The exit status by which CTest recognizes a skipped test
constexpr const int exit_status_skipped { 77 };

namespace std {

std::ostream& operator<<(std::ostream& os, cudamps::device::compute_capability_t cc)
{
	return os << cc.major() << '.' << cc.minor();
}

template <typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& v)
{
	os << '[';
	for(auto it = v.cbegin(); it != v.cend(); it++) {
		if (it != v.cbegin()) { os << ", "; }
		os << *it;
	}
	return os << ']';
}

} // namespace std

[[noreturn]] bool die_(const std::string& message)
{
	std::cerr << message << "\n";
	exit(EXIT_FAILURE);
}

[[noreturn]] void skip_(const std::string& reason)
{
	std::cout << "SKIPPED: " << reason << std::endl;
	exit(exit_status_skipped);
}

#define assert_(cond) \
{ \
	auto evaluation_result = (cond); \
	if (not evaluation_result) \
		die_("Assertion failed at line " + std::to_string(__LINE__) + ": " #cond); \
}

/**
 * Checks that evaluating @p expression throws a @ref cudamps::runtime_error with
 * the specified status.
 */
#define assert_fails_with_(expected_status, expression) \
{ \
	bool threw = false; \
	try { \
		expression; \
	} \
	catch (const cudamps::runtime_error& ex) { \
		threw = true; \
		if (ex.code() != (expected_status)) { \
			die_("At line " + std::to_string(__LINE__) + ": " #expression " failed with \"" \
				+ ex.what() + "\" rather than with " + cudamps::describe(expected_status)); \
		} \
		std::cout << "As expected: " << ex.what() << '\n'; \
	} \
	if (not threw) { \
		die_("At line " + std::to_string(__LINE__) + ": " #expression " succeeded, but should have failed with " \
			+ cudamps::describe(expected_status)); \
	} \
}

#endif // EXAMPLES_COMMON_HPP_
