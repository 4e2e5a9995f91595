#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Reads until @p count bytes are read or EOF; errno is 0 iff no error occurred
size_t read_all(int fd, void* buf, size_t count) noexcept;

// Writes @p count bytes unless an error occurs; errno is 0 iff no error occurred
size_t write_all(int fd, const void* buf, size_t count) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

/**
 * @brief Writes @p str to @p fd
 *
 * @errors Throws an exception std::runtime_error if a write(2) error occurs
 */
void write_all_throw(int fd, std::string_view str);

/**
 * @brief Reads at most @p bytes bytes (until EOF) from @p fd
 *
 * @errors Throws an exception std::runtime_error if a read(2) error occurs
 */
std::string get_file_contents(int fd, size_t bytes = static_cast<size_t>(-1));

/**
 * @brief Reads the whole file @p file
 *
 * @errors Throws an exception std::runtime_error if an open(2) or read(2)
 *   error occurs
 */
std::string get_file_contents(const std::string& file);

/**
 * @brief Writes @p data to file @p file (the file is truncated or created
 *   with mode 0644)
 *
 * @errors Throws an exception std::runtime_error if an open(2) or write(2)
 *   error occurs
 */
void put_file_contents(const std::string& file, std::string_view data);
