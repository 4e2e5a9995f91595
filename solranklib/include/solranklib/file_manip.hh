#pragma once

#include <fcntl.h>
#include <string>
#include <vector>

/**
 * @brief Removes recursively file/directory @p pathname relative to a
 *   directory file descriptor @p dirfd
 *
 * @return 0 on success, -1 on error (errno is set)
 */
[[nodiscard]] int remove_rat(int dirfd, const std::string& pathname) noexcept;

// Removes recursively file/directory @p pathname
[[nodiscard]] inline int remove_r(const std::string& pathname) noexcept {
    return remove_rat(AT_FDCWD, pathname);
}

[[nodiscard]] bool path_exists(const std::string& pathname) noexcept;

[[nodiscard]] bool is_directory(const std::string& pathname) noexcept;

[[nodiscard]] bool is_regular_file(const std::string& pathname) noexcept;

/**
 * @brief Lists names of the regular files in directory @p dir whose names
 *   match the shell wildcard @p pattern (see fnmatch(3)), sorted by name
 *
 * @errors Throws an exception std::runtime_error if an opendir(3) or
 *   readdir(3) error occurs
 */
std::vector<std::string> list_matching_files(const std::string& dir, const char* pattern);
