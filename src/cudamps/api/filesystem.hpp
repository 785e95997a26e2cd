/**
 * @file
 *
 * @brief The few filesystem operations the supervisor performs: reading small
 * files (including `/proc` pseudo-files), and creating and removing daemon
 * pipe/log directories.
 *
 * @note We're not writing C++17 here, so no `::std::filesystem`; these are
 * thin wrappers around the POSIX calls.
 */
#pragma once
#ifndef CUDAMPS_FILESYSTEM_HPP_
#define CUDAMPS_FILESYSTEM_HPP_

#include "types.hpp"
#include "error.hpp"

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace cudamps {

namespace filesystem {

/**
 * @brief Reads an entire file.
 *
 * @note Works for `/proc` pseudo-files, whose reported size is 0.
 *
 * @return the file's contents; an empty string if it does not exist or
 * cannot be read - e.g. for lack of permissions, or since the process whose
 * `/proc` entry it is has exited.
 */
inline ::std::string read(const ::std::string& path)
{
	::std::ifstream file { path, ::std::ios::in | ::std::ios::binary };
	if (not file) { return {}; }
	::std::string contents {
		::std::istreambuf_iterator<char>(file),
		::std::istreambuf_iterator<char>() };
	if (file.bad()) { return {}; }
	return contents;
}

inline bool is_directory(const ::std::string& path)
{
	struct stat status;
	return (::stat(path.c_str(), &status) == 0) and S_ISDIR(status.st_mode);
}

inline ::std::string join(const ::std::string& directory, const ::std::string& file_name)
{
	if (directory.empty() or directory.back() == '/') { return directory + file_name; }
	return directory + '/' + file_name;
}

/**
 * @brief Creates a new, uniquely-named directory under the system's temporary
 * directory (`$TMPDIR`, or `/tmp` if that's not set), accessible only by
 * the current user.
 *
 * @return the path of the new directory
 */
inline ::std::string make_temporary_directory(const ::std::string& name_prefix)
{
	auto tmpdir = ::std::getenv("TMPDIR");
	::std::string base { (tmpdir != nullptr and *tmpdir != '\0') ? tmpdir : "/tmp" };
	auto template_ = join(base, name_prefix + "XXXXXX");
	::std::vector<char> buffer { template_.begin(), template_.end() };
	buffer.push_back('\0');
	if (::mkdtemp(buffer.data()) == nullptr) {
		throw_os_error("Failed creating a temporary directory using the template " + template_);
	}
	return { buffer.data() };
}

namespace detail_ {

inline int remove_entry(const char* path, const struct stat*, int, struct FTW*)
{
	return ::remove(path);
}

} // namespace detail_

/**
 * @brief Removes a directory along with everything inside it; symbolic links
 * are removed rather than followed.
 *
 * @note Removing a directory which does not exist is not an error.
 */
inline void remove_tree(const ::std::string& path)
{
	struct stat status;
	if (::lstat(path.c_str(), &status) != 0 and errno == ENOENT) { return; }
	static constexpr const int max_open_descriptors { 64 };
	auto result = ::nftw(path.c_str(), detail_::remove_entry, max_open_descriptors, FTW_DEPTH | FTW_PHYS);
	if (result != 0) {
		throw_os_error("Failed removing the directory tree at " + path);
	}
}

} // namespace filesystem

} // namespace cudamps

#endif // CUDAMPS_FILESYSTEM_HPP_
