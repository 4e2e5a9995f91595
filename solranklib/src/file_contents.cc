#include <array>
#include <cstdint>
#include <solranklib/errmsg.hh>
#include <solranklib/file_contents.hh>
#include <solranklib/file_descriptor.hh>
#include <solranklib/macros/throw.hh>
#include <unistd.h>

using std::array;
using std::string;

size_t read_all(int fd, void* buf, size_t count) noexcept {
    ssize_t k = 0;
    size_t pos = 0;
    auto* buff = static_cast<uint8_t*>(buf);
    while (pos < count) {
        k = read(fd, buff + pos, count - pos);
        if (k > 0) {
            pos += k;
        } else if (k == 0) {
            errno = 0; // No error
            return pos;

        } else if (errno != EINTR) {
            return pos; // Error
        }
    }

    errno = 0; // No error
    return count;
}

size_t write_all(int fd, const void* buf, size_t count) noexcept {
    ssize_t k = 0;
    size_t pos = 0;
    const auto* buff = static_cast<const uint8_t*>(buf);
    errno = 0;
    while (pos < count) {
        k = write(fd, buff + pos, count - pos);
        if (k >= 0) {
            pos += k;
        } else if (errno != EINTR) {
            return pos; // Error
        }
    }

    errno = 0; // errno may still be EINTR here
    return count;
}

void write_all_throw(int fd, std::string_view str) {
    if (write_all(fd, str) != str.size()) {
        THROW("write()", errmsg());
    }
}

string get_file_contents(int fd, size_t bytes) {
    string res;
    array<char, 65536> buff{};
    while (bytes > 0) {
        ssize_t len = read(fd, buff.data(), std::min(buff.size(), bytes));
        // Interrupted by signal
        if (len < 0 && errno == EINTR) {
            continue;
        }
        // Error
        if (len < 0) {
            THROW("read() failed", errmsg());
        }
        // EOF
        if (len == 0) {
            break;
        }

        bytes -= len;
        res.append(buff.data(), len);
    }

    return res;
}

string get_file_contents(const string& file) {
    FileDescriptor fd{file, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    return get_file_contents(fd);
}

void put_file_contents(const string& file, std::string_view data) {
    FileDescriptor fd{file, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("Failed to open file `", file, '`', errmsg());
    }

    write_all_throw(fd, data);
}
