#pragma once

#include <string>

/**
 * @brief Returns the current working directory with a trailing '/'
 *
 * @errors Throws an exception std::runtime_error if a getcwd(3) error occurs
 */
std::string get_cwd();
